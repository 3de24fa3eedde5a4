#include "dnsgate/rule.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cstdio>

namespace dnsgate {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool validLabelChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

// 校验不带结尾点的小写域名
bool validName(const std::string& name) {
    if (name.empty() || name.size() + 1 > MAX_DOMAIN_LENGTH) {
        return false;
    }
    size_t label_len = 0;
    for (char c : name) {
        if (c == '.') {
            if (label_len == 0) return false;
            label_len = 0;
            continue;
        }
        if (!validLabelChar(c)) return false;
        if (++label_len > MAX_LABEL_LENGTH) return false;
    }
    return label_len > 0;
}

} // namespace

// ==================== Target ====================

Error Target::parse(const std::string& text, Target* out) {
    std::string value = trim(text);
    if (value.empty()) {
        return Error::InvalidTarget;
    }

    Target target;
    if (lowercase(value) == "refused") {
        target.kind = TargetKind::Refuse;
        target.text = "REFUSED";
        *out = target;
        return Error::Success;
    }

    char buf[INET6_ADDRSTRLEN];
    in_addr v4{};
    if (::inet_pton(AF_INET, value.c_str(), &v4) == 1) {
        target.kind = TargetKind::IPv4;
        target.ipv4 = v4.s_addr;
        ::inet_ntop(AF_INET, &v4, buf, sizeof(buf));
        target.text = buf;
        *out = target;
        return Error::Success;
    }

    in6_addr v6{};
    if (::inet_pton(AF_INET6, value.c_str(), &v6) == 1) {
        target.kind = TargetKind::IPv6;
        std::memcpy(target.ipv6, &v6, 16);
        ::inet_ntop(AF_INET6, &v6, buf, sizeof(buf));
        target.text = buf;
        *out = target;
        return Error::Success;
    }

    return Error::InvalidTarget;
}

// ==================== TimeWindow ====================

bool TimeWindow::contains(uint16_t minute) const {
    minute = static_cast<uint16_t>(minute % MINUTES_PER_DAY);
    if (start == end) {
        return true;
    }
    if (start < end) {
        return minute >= start && minute < end;
    }
    // 跨越午夜, 例如 22:00-06:00
    return minute >= start || minute < end;
}

Error TimeWindow::parseClock(const std::string& text, uint16_t* minutes) {
    std::string value = trim(text);
    auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || value.size() != colon + 3) {
        return Error::InvalidWindow;
    }

    int hour = 0;
    for (size_t i = 0; i < colon; i++) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return Error::InvalidWindow;
        hour = hour * 10 + (value[i] - '0');
    }
    int minute = 0;
    for (size_t i = colon + 1; i < value.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return Error::InvalidWindow;
        minute = minute * 10 + (value[i] - '0');
    }

    if (hour > 23 || minute > 59) {
        return Error::InvalidWindow;
    }

    *minutes = static_cast<uint16_t>(hour * 60 + minute);
    return Error::Success;
}

std::string TimeWindow::formatClock(uint16_t minutes) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02u:%02u",
                  static_cast<unsigned>((minutes / 60) % 24),
                  static_cast<unsigned>(minutes % 60));
    return buf;
}

Error TimeWindow::parse(const std::string& start, const std::string& end, TimeWindow* out) {
    std::string s = trim(start);
    std::string e = trim(end);
    if (s.empty() && e.empty()) {
        *out = TimeWindow();
        return Error::Success;
    }

    TimeWindow window;
    if (parseClock(s, &window.start) != Error::Success ||
        parseClock(e, &window.end) != Error::Success) {
        return Error::InvalidWindow;
    }
    *out = window;
    return Error::Success;
}

// ==================== Rule ====================

Error Rule::normalizePattern(const std::string& raw, std::string* out) {
    std::string value = lowercase(trim(raw));
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    if (value.empty()) {
        return Error::InvalidPattern;
    }

    std::string name = value;
    if (value.size() >= 2 && value[0] == '*' && value[1] == '.') {
        name = value.substr(2);
    }

    // 通配符只允许出现在首标签
    if (!validName(name)) {
        return Error::InvalidPattern;
    }

    *out = value + ".";
    return Error::Success;
}

std::string Rule::normalizeName(const std::string& name) {
    std::string value = lowercase(trim(name));
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    value.push_back('.');
    return value;
}

Error Rule::create(
    const std::string& pattern,
    const std::string& target,
    const TimeWindow& window,
    bool enabled,
    std::optional<Rule>* out
) {
    Target parsed;
    Error err = Target::parse(target, &parsed);
    if (err != Error::Success) {
        return err;
    }
    return create(pattern, parsed, window, enabled, out);
}

Error Rule::create(
    const std::string& pattern,
    const Target& target,
    const TimeWindow& window,
    bool enabled,
    std::optional<Rule>* out
) {
    if (!window.valid()) {
        return Error::InvalidWindow;
    }

    Rule rule;
    Error err = normalizePattern(pattern, &rule.pattern_);
    if (err != Error::Success) {
        return err;
    }

    rule.wildcard_ = rule.pattern_.compare(0, 2, "*.") == 0;
    rule.suffix_ = rule.wildcard_ ? rule.pattern_.substr(2) : rule.pattern_;
    rule.target_ = target;
    rule.window_ = window;
    rule.enabled_ = enabled;

    *out = std::move(rule);
    return Error::Success;
}

Rule Rule::withEnabled(bool enabled) const {
    Rule copy = *this;
    copy.enabled_ = enabled;
    return copy;
}

} // namespace dnsgate
