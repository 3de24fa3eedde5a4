#pragma once

#include "common.hpp"
#include <optional>
#include <string>

namespace dnsgate {

// 规则目标: 拒绝或重定向到某个地址
enum class TargetKind : uint8_t {
    Refuse = 0,
    IPv4 = 1,
    IPv6 = 2,
};

struct Target {
    TargetKind kind = TargetKind::Refuse;
    uint32_t ipv4 = 0;          // 网络字节序
    uint8_t ipv6[16] = {};
    std::string text = "REFUSED";

    bool isRefuse() const { return kind == TargetKind::Refuse; }

    // "REFUSED" (大小写不敏感) 或 IPv4/IPv6 字面量
    static Error parse(const std::string& text, Target* out);
};

// 每日时间窗 [start, end), 单位为本地时间零点起的分钟数
// start == end 表示全天; start > end 表示跨越午夜
struct TimeWindow {
    uint16_t start = 0;
    uint16_t end = 0;

    TimeWindow() = default;
    TimeWindow(uint16_t s, uint16_t e) : start(s), end(e) {}

    bool allDay() const { return start == end; }
    bool valid() const { return start < MINUTES_PER_DAY && end < MINUTES_PER_DAY; }
    bool contains(uint16_t minute) const;

    // 两端都为空时为全天
    static Error parse(const std::string& start, const std::string& end, TimeWindow* out);

    // "HH:MM" -> 分钟数
    static Error parseClock(const std::string& text, uint16_t* minutes);
    static std::string formatClock(uint16_t minutes);
};

// 过滤规则 (构造时校验, 之后不可变)
class Rule {
public:
    static Error create(
        const std::string& pattern,
        const std::string& target,
        const TimeWindow& window,
        bool enabled,
        std::optional<Rule>* out
    );

    static Error create(
        const std::string& pattern,
        const Target& target,
        const TimeWindow& window,
        bool enabled,
        std::optional<Rule>* out
    );

    // 规范化模式: 小写, 单个结尾的点, "*" 只能是完整的首标签
    static Error normalizePattern(const std::string& raw, std::string* out);

    // 规范化查询名: 小写, 单个结尾的点
    static std::string normalizeName(const std::string& name);

    const std::string& pattern() const { return pattern_; }
    const Target& target() const { return target_; }
    const TimeWindow& window() const { return window_; }
    bool enabled() const { return enabled_; }

    bool isWildcard() const { return wildcard_; }

    // 通配符规则为 "*." 之后的部分, 精确规则为整个模式
    const std::string& suffix() const { return suffix_; }

    bool activeAt(uint16_t minute) const {
        return enabled_ && window_.contains(minute);
    }

    Rule withEnabled(bool enabled) const;

private:
    Rule() = default;

    std::string pattern_;
    std::string suffix_;
    Target target_;
    TimeWindow window_;
    bool enabled_ = true;
    bool wildcard_ = false;
};

} // namespace dnsgate
