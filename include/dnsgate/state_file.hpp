#pragma once

#include "rule_store.hpp"
#include <string>
#include <utility>
#include <vector>

namespace dnsgate {

// 持久化文件中的一条规则 (原始文本)
struct PersistedRule {
    std::string pattern;
    std::string ip;          // IP 字面量或 "REFUSED"
    std::string start;       // "HH:MM", 为空表示全天
    std::string end;
    bool enabled = true;
};

struct PersistedState {
    std::vector<PersistedRule> rules;
    bool maintenance = false;
};

// 启动时丢弃的无效规则
struct RejectedRule {
    PersistedRule rule;
    Error error;
};

// 规则与维护状态的持久化文件 (JSON)
//
//   {"rules": [{"pattern": "*.ads.example.", "ip": "REFUSED",
//               "start": "00:00", "end": "00:00", "enabled": true}],
//    "maintenance": false}
//
// 读取时也接受旧键名 "bloqueos".
// retained 为启动时无法加载的规则, 原样写回, 不因改写文件而丢失.
class StateFile {
public:
    static Error parse(const std::string& text, PersistedState* out);
    static Error load(const std::string& path, PersistedState* out);

    static std::string serialize(
        const RuleSnapshot& snapshot,
        bool maintenance,
        const std::vector<PersistedRule>& retained = {}
    );

    // 先写临时文件再重命名
    static Error save(
        const std::string& path,
        const RuleSnapshot& snapshot,
        bool maintenance,
        const std::vector<PersistedRule>& retained = {}
    );

    // 转换为快照, 无效规则跳过并写入 rejected
    static SnapshotPtr buildSnapshot(
        const PersistedState& state,
        std::vector<RejectedRule>* rejected
    );
};

} // namespace dnsgate
