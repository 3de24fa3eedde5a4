#include "dnsgate/control_console.hpp"
#include "dnsgate/logging.hpp"
#include "dnsgate/state_file.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <vector>

namespace dnsgate {

namespace {

// 轮询间隔, 用于周期性检查 stopped_
constexpr int POLL_INTERVAL_MS = 200;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

ControlConsole::ControlConsole(
    RuleStore& store,
    StatsRecorder& stats,
    QueryLog& log,
    std::string state_path,
    std::ostream& out
)
    : store_(store),
      stats_(stats),
      log_(log),
      state_path_(std::move(state_path)),
      out_(out) {}

void ControlConsole::run(int fd) {
    std::string pending;
    char buffer[1024];

    while (!stopped_.load()) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logging::get()->warn("console poll failed: {}", std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            logging::get()->warn("console read failed: {}", std::strerror(errno));
            return;
        }
        if (n == 0) {
            // 输入结束, 最后一行可能没有换行符
            if (!pending.empty()) {
                handleCommand(pending);
            }
            return;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!handleCommand(line)) {
                return;
            }
        }
    }
}

bool ControlConsole::handleCommand(const std::string& line) {
    std::istringstream stream(line);
    std::string token;
    if (!(stream >> token)) {
        return true;
    }
    std::string command = lowercase(token);

    if (command == "help") {
        printHelp();
        return true;
    }

    if (command == "quit" || command == "exit") {
        if (on_quit_) {
            on_quit_();
        }
        return false;
    }

    if (command == "list") {
        listRules();
        return true;
    }

    if (command == "add") {
        std::string pattern, target, start, end;
        if (!(stream >> pattern >> target)) {
            out_ << "Usage: add <pattern> <ip|REFUSED> [HH:MM HH:MM]" << std::endl;
            return true;
        }
        stream >> start >> end;

        TimeWindow window;
        Error err = TimeWindow::parse(start, end, &window);
        if (err == Error::Success) {
            err = store_.addRule(pattern, target, window, true);
        }
        if (err != Error::Success) {
            out_ << "Rejected: " << errorString(err) << std::endl;
            return true;
        }
        out_ << "Added " << pattern << " -> " << target << std::endl;
        persist();
        return true;
    }

    if (command == "remove" || command == "toggle") {
        std::string pattern;
        if (!(stream >> pattern)) {
            out_ << "Specify a pattern." << std::endl;
            return true;
        }

        bool enabled = false;
        Error err = command == "remove" ? store_.removeRule(pattern)
                                        : store_.toggleRule(pattern, &enabled);
        if (command == "remove" && removeRetained(pattern)) {
            err = Error::Success;
        }
        if (err != Error::Success) {
            out_ << pattern << " was not found." << std::endl;
            return true;
        }

        if (command == "remove") {
            out_ << "Removed " << pattern << std::endl;
        } else {
            out_ << (enabled ? "Enabled " : "Disabled ") << pattern << std::endl;
        }
        persist();
        return true;
    }

    if (command == "maintenance") {
        std::string action;
        stream >> action;
        action = lowercase(action);

        if (action == "on") {
            store_.setMaintenance(true);
        } else if (action == "off") {
            store_.setMaintenance(false);
        } else if (action == "toggle" || action.empty()) {
            store_.setMaintenance(!store_.maintenance());
        } else {
            out_ << "Usage: maintenance on|off|toggle" << std::endl;
            return true;
        }
        out_ << "Maintenance mode " << (store_.maintenance() ? "on" : "off") << std::endl;
        persist();
        return true;
    }

    if (command == "stats") {
        printStats();
        return true;
    }

    if (command == "reset-stats") {
        stats_.reset();
        out_ << "Statistics reset." << std::endl;
        return true;
    }

    if (command == "logs") {
        printLogs();
        return true;
    }

    out_ << "Unknown command. Type 'help' for a list of commands." << std::endl;
    return true;
}

void ControlConsole::printHelp() {
    out_ << "Commands:" << std::endl;
    out_ << "  list" << std::endl;
    out_ << "  add <pattern> <ip|REFUSED> [HH:MM HH:MM]" << std::endl;
    out_ << "  remove <pattern>" << std::endl;
    out_ << "  toggle <pattern>" << std::endl;
    out_ << "  maintenance on|off|toggle" << std::endl;
    out_ << "  stats" << std::endl;
    out_ << "  reset-stats" << std::endl;
    out_ << "  logs" << std::endl;
    out_ << "  quit" << std::endl;
}

void ControlConsole::listRules() {
    auto snapshot = store_.currentSnapshot();
    if (snapshot->empty() && retained_.empty()) {
        out_ << "No rules." << std::endl;
        return;
    }

    out_ << "Rules (version " << snapshot->version() << "):" << std::endl;
    for (const auto& rule : snapshot->rules()) {
        out_ << "  " << rule.pattern() << " -> " << rule.target().text << " "
             << TimeWindow::formatClock(rule.window().start) << "-"
             << TimeWindow::formatClock(rule.window().end)
             << (rule.enabled() ? "" : " (disabled)") << std::endl;
    }

    if (!retained_.empty()) {
        out_ << "Not loaded (kept in state file):" << std::endl;
        for (const auto& rule : retained_) {
            out_ << "  " << rule.pattern << " -> " << rule.ip << std::endl;
        }
    }
}

void ControlConsole::printStats() {
    auto c = stats_.counters();
    out_ << "queries=" << c.queries
         << " refused=" << c.refused
         << " redirected=" << c.redirected
         << " nodata=" << c.no_data
         << " forwarded=" << c.forwarded
         << " servfail=" << c.servfail
         << " maintenance=" << c.maintenance
         << " dropped=" << c.dropped << std::endl;

    auto entries = stats_.snapshot();
    if (entries.empty()) {
        return;
    }

    // 按命中次数从高到低
    std::vector<std::pair<std::string, StatsEntry>> sorted(entries.begin(), entries.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second.count > b.second.count;
    });
    for (const auto& [pattern, entry] : sorted) {
        out_ << "  " << pattern << " " << entry.count
             << " last=" << QueryLog::formatTimestamp(entry.last_matched) << std::endl;
    }
}

void ControlConsole::printLogs() {
    auto entries = log_.recent();
    if (entries.empty()) {
        out_ << "No queries logged." << std::endl;
        return;
    }
    for (const auto& entry : entries) {
        out_ << QueryLog::formatTimestamp(entry.timestamp) << " " << entry.client << " "
             << entry.name << " (" << typeName(entry.qtype) << ") " << entry.action << std::endl;
    }
}

void ControlConsole::persist() {
    if (state_path_.empty()) {
        return;
    }
    auto snapshot = store_.currentSnapshot();
    Error err = StateFile::save(state_path_, *snapshot, store_.maintenance(), retained_);
    if (err != Error::Success) {
        logging::get()->error("failed to write {}: {}", state_path_, errorString(err));
    }
}

// 按原文删除未加载的规则
bool ControlConsole::removeRetained(const std::string& pattern) {
    auto before = retained_.size();
    retained_.erase(
        std::remove_if(retained_.begin(), retained_.end(), [&pattern](const PersistedRule& rule) {
            return rule.pattern == pattern;
        }),
        retained_.end()
    );
    return retained_.size() != before;
}

} // namespace dnsgate
