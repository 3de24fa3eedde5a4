#pragma once

#include "domain_trie.hpp"
#include "rule.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dnsgate {

// 不可变的规则快照, 插入顺序即同级规则的优先顺序
class RuleSnapshot {
public:
    RuleSnapshot();
    explicit RuleSnapshot(std::vector<Rule> rules, uint64_t version = 0);

    // 索引持有指向 rules_ 元素的指针
    RuleSnapshot(const RuleSnapshot&) = delete;
    RuleSnapshot& operator=(const RuleSnapshot&) = delete;

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    uint64_t version() const { return version_; }

    const DomainTrie& index() const { return index_; }

    // 基于本快照加上增量生成新快照
    std::shared_ptr<const RuleSnapshot> withAdded(const Rule& rule, uint64_t version) const;
    std::shared_ptr<const RuleSnapshot> withRemoved(const std::string& pattern, uint64_t version) const;
    std::shared_ptr<const RuleSnapshot> withToggled(const std::string& pattern, uint64_t version) const;

    // 返回与模式相同的规则数量
    size_t count(const std::string& pattern) const;

private:
    std::vector<Rule> rules_;
    uint64_t version_;
    DomainTrie index_;
};

using SnapshotPtr = std::shared_ptr<const RuleSnapshot>;

// 默认维护提示
constexpr const char* DEFAULT_MAINTENANCE_TEXT = "dnsgate: service under maintenance";

// 规则存储 - 写时复制
//
// 查询路径通过 currentSnapshot() 无锁读取; 管理操作基于当前快照生成新快照并
// 整体替换, 已取得旧快照的读者不受影响. 管理操作之间用 writer_mutex_ 串行化.
class RuleStore {
public:
    explicit RuleStore(std::string maintenance_text = DEFAULT_MAINTENANCE_TEXT);
    ~RuleStore() = default;

    // 禁止拷贝
    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    SnapshotPtr currentSnapshot() const;

    // 整体替换当前快照
    void publish(SnapshotPtr snapshot);

    // 管理接口: 校验失败时不发布任何变化
    Error addRule(
        const std::string& pattern,
        const std::string& target,
        const TimeWindow& window,
        bool enabled = true
    );
    Error addRule(const Rule& rule);

    // 删除模式相同的所有规则
    Error removeRule(const std::string& pattern);

    // 切换模式相同的第一条规则
    Error toggleRule(const std::string& pattern, bool* enabled_now = nullptr);

    void setMaintenance(bool enabled);
    bool maintenance() const;
    const std::string& maintenanceText() const { return maintenance_text_; }

private:
    SnapshotPtr current_;
    std::atomic<bool> maintenance_;
    const std::string maintenance_text_;

    std::mutex writer_mutex_;
    uint64_t next_version_;
};

} // namespace dnsgate
