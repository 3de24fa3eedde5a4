#pragma once

#include "query_log.hpp"
#include "rule_store.hpp"
#include "state_file.hpp"
#include "stats_recorder.hpp"
#include <atomic>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace dnsgate {

// 标准输入上的管理命令
//
//   add <pattern> <ip|REFUSED> [HH:MM HH:MM]
//   remove <pattern> / toggle <pattern>
//   maintenance on|off|toggle
//   list / stats / reset-stats / logs / help / quit
//
// 变更成功后写回持久化文件 (state_path 为空时不写).
// 启动时无法加载的规则随文件一起写回, remove 可将其删除.
class ControlConsole {
public:
    ControlConsole(
        RuleStore& store,
        StatsRecorder& stats,
        QueryLog& log,
        std::string state_path,
        std::ostream& out
    );

    // 从 fd 读取命令直到输入结束, quit 或 stop()
    void run(int fd);

    // 可从其他线程调用, run() 在一个轮询周期内返回
    void stop() { stopped_.store(true); }

    // 处理一行命令, quit 返回 false
    bool handleCommand(const std::string& line);

    // quit 时调用
    void setQuitHandler(std::function<void()> handler) { on_quit_ = std::move(handler); }

    void setRetainedRules(std::vector<PersistedRule> rules) { retained_ = std::move(rules); }

private:
    void printHelp();
    void listRules();
    void printStats();
    void printLogs();
    void persist();
    bool removeRetained(const std::string& pattern);

    RuleStore& store_;
    StatsRecorder& stats_;
    QueryLog& log_;
    std::string state_path_;
    std::ostream& out_;
    std::function<void()> on_quit_;
    std::vector<PersistedRule> retained_;
    std::atomic<bool> stopped_{false};
};

} // namespace dnsgate
