#pragma once

#include "rule_store.hpp"
#include <chrono>
#include <string>

namespace dnsgate {

// 判定动作
enum class Verdict : uint8_t {
    Pass = 0,
    Block = 1,
};

// 判定结果
struct Decision {
    Verdict verdict;
    const Rule* rule;   // Block 时为命中的规则, 生命期随快照

    Decision() : verdict(Verdict::Pass), rule(nullptr) {}
    explicit Decision(const Rule* r) : verdict(Verdict::Block), rule(r) {}

    bool isBlock() const { return verdict == Verdict::Block; }
};

// 规则匹配 - 纯函数, 不做 I/O, 不加锁
//
// 候选规则: 已启用, 模式匹配, 当前时刻在时间窗内.
// 精确规则优先于通配符; 通配符之间后缀越长越优先; 其余按插入顺序.
class Matcher {
public:
    static Decision decide(
        const std::string& name,
        const RuleSnapshot& snapshot,
        uint16_t now_minutes
    );

    // 本地时间零点起的分钟数
    static uint16_t minuteOfDay(std::chrono::system_clock::time_point tp);

private:
    static const Rule* firstActive(
        const std::vector<const Rule*>& rules,
        uint16_t now_minutes
    );
};

} // namespace dnsgate
