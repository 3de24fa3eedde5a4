#include "dnsgate/rule_store.hpp"
#include "dnsgate/logging.hpp"

namespace dnsgate {

// ==================== RuleSnapshot ====================

RuleSnapshot::RuleSnapshot() : version_(0) {}

RuleSnapshot::RuleSnapshot(std::vector<Rule> rules, uint64_t version)
    : rules_(std::move(rules)), version_(version) {
    for (const auto& rule : rules_) {
        index_.insert(&rule);
    }
}

SnapshotPtr RuleSnapshot::withAdded(const Rule& rule, uint64_t version) const {
    std::vector<Rule> rules;
    rules.reserve(rules_.size() + 1);
    rules.insert(rules.end(), rules_.begin(), rules_.end());
    rules.push_back(rule);
    return std::make_shared<const RuleSnapshot>(std::move(rules), version);
}

SnapshotPtr RuleSnapshot::withRemoved(const std::string& pattern, uint64_t version) const {
    std::vector<Rule> rules;
    rules.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (rule.pattern() != pattern) {
            rules.push_back(rule);
        }
    }
    return std::make_shared<const RuleSnapshot>(std::move(rules), version);
}

SnapshotPtr RuleSnapshot::withToggled(const std::string& pattern, uint64_t version) const {
    std::vector<Rule> rules;
    rules.reserve(rules_.size());
    bool toggled = false;
    for (const auto& rule : rules_) {
        if (!toggled && rule.pattern() == pattern) {
            rules.push_back(rule.withEnabled(!rule.enabled()));
            toggled = true;
        } else {
            rules.push_back(rule);
        }
    }
    return std::make_shared<const RuleSnapshot>(std::move(rules), version);
}

size_t RuleSnapshot::count(const std::string& pattern) const {
    size_t n = 0;
    for (const auto& rule : rules_) {
        if (rule.pattern() == pattern) n++;
    }
    return n;
}

// ==================== RuleStore ====================

RuleStore::RuleStore(std::string maintenance_text)
    : current_(std::make_shared<const RuleSnapshot>()),
      maintenance_(false),
      maintenance_text_(std::move(maintenance_text)),
      next_version_(1) {}

SnapshotPtr RuleStore::currentSnapshot() const {
    return std::atomic_load(&current_);
}

void RuleStore::publish(SnapshotPtr snapshot) {
    if (!snapshot) {
        snapshot = std::make_shared<const RuleSnapshot>();
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    if (snapshot->version() >= next_version_) {
        next_version_ = snapshot->version() + 1;
    }
    std::atomic_store(&current_, std::move(snapshot));
}

Error RuleStore::addRule(
    const std::string& pattern,
    const std::string& target,
    const TimeWindow& window,
    bool enabled
) {
    std::optional<Rule> rule;
    Error err = Rule::create(pattern, target, window, enabled, &rule);
    if (err != Error::Success) {
        logging::get()->warn("rejected rule '{}' -> '{}': {}", pattern, target, errorString(err));
        return err;
    }
    return addRule(*rule);
}

Error RuleStore::addRule(const Rule& rule) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto current = std::atomic_load(&current_);
    std::atomic_store(&current_, current->withAdded(rule, next_version_++));

    logging::get()->info("rule added: {} -> {} [{}-{}]{}",
                         rule.pattern(), rule.target().text,
                         TimeWindow::formatClock(rule.window().start),
                         TimeWindow::formatClock(rule.window().end),
                         rule.enabled() ? "" : " (disabled)");
    return Error::Success;
}

Error RuleStore::removeRule(const std::string& pattern) {
    std::string normalized;
    if (Rule::normalizePattern(pattern, &normalized) != Error::Success) {
        return Error::RuleNotFound;
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto current = std::atomic_load(&current_);
    size_t n = current->count(normalized);
    if (n == 0) {
        return Error::RuleNotFound;
    }
    std::atomic_store(&current_, current->withRemoved(normalized, next_version_++));

    logging::get()->info("rule removed: {} ({} entries)", normalized, n);
    return Error::Success;
}

Error RuleStore::toggleRule(const std::string& pattern, bool* enabled_now) {
    std::string normalized;
    if (Rule::normalizePattern(pattern, &normalized) != Error::Success) {
        return Error::RuleNotFound;
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto current = std::atomic_load(&current_);
    if (current->count(normalized) == 0) {
        return Error::RuleNotFound;
    }
    auto next = current->withToggled(normalized, next_version_++);

    bool enabled = false;
    for (const auto& rule : next->rules()) {
        if (rule.pattern() == normalized) {
            enabled = rule.enabled();
            break;
        }
    }
    std::atomic_store(&current_, std::move(next));

    if (enabled_now) {
        *enabled_now = enabled;
    }
    logging::get()->info("rule {}: {}", enabled ? "enabled" : "disabled", normalized);
    return Error::Success;
}

void RuleStore::setMaintenance(bool enabled) {
    bool previous = maintenance_.exchange(enabled, std::memory_order_acq_rel);
    if (previous != enabled) {
        logging::get()->info("maintenance mode {}", enabled ? "on" : "off");
    }
}

bool RuleStore::maintenance() const {
    return maintenance_.load(std::memory_order_acquire);
}

} // namespace dnsgate
