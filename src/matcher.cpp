#include "dnsgate/matcher.hpp"

#include <ctime>

namespace dnsgate {

Decision Matcher::decide(
    const std::string& name,
    const RuleSnapshot& snapshot,
    uint16_t now_minutes
) {
    if (snapshot.empty()) {
        return Decision();
    }

    now_minutes = static_cast<uint16_t>(now_minutes % MINUTES_PER_DAY);
    std::string normalized = Rule::normalizeName(name);

    TrieMatch match;
    snapshot.index().lookup(normalized, &match);

    // 精确匹配优先
    if (match.exact) {
        if (const Rule* rule = firstActive(*match.exact, now_minutes)) {
            return Decision(rule);
        }
    }

    // 通配符按后缀长度从长到短
    for (const auto* candidates : match.wildcards) {
        if (const Rule* rule = firstActive(*candidates, now_minutes)) {
            return Decision(rule);
        }
    }

    return Decision();
}

const Rule* Matcher::firstActive(
    const std::vector<const Rule*>& rules,
    uint16_t now_minutes
) {
    for (const Rule* rule : rules) {
        if (rule->activeAt(now_minutes)) {
            return rule;
        }
    }
    return nullptr;
}

uint16_t Matcher::minuteOfDay(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return static_cast<uint16_t>(tm.tm_hour * 60 + tm.tm_min);
}

} // namespace dnsgate
