#pragma once

#include "common.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dnsgate {

// 单个模式的命中统计
struct StatsEntry {
    uint64_t count = 0;
    std::chrono::system_clock::time_point last_matched{};
};

// 查询结果分类
enum class Outcome : uint8_t {
    Maintenance = 0,
    Refused = 1,
    Redirected = 2,
    NoData = 3,
    Forwarded = 4,
    ServFail = 5,
    Dropped = 6,
};

// 命中统计 - 只由查询路径写入, 供管理界面读取与清零
class StatsRecorder {
public:
    StatsRecorder() = default;

    // 禁止拷贝
    StatsRecorder(const StatsRecorder&) = delete;
    StatsRecorder& operator=(const StatsRecorder&) = delete;

    // 记录一次阻断命中
    void recordMatch(const std::string& pattern, std::chrono::system_clock::time_point when);

    // 记录一次查询结果
    void recordOutcome(Outcome outcome);

    // 当前各模式统计的一致副本 (按模式排序)
    std::map<std::string, StatsEntry> snapshot() const;

    // 全局计数
    struct Counters {
        uint64_t queries;
        uint64_t maintenance;
        uint64_t refused;
        uint64_t redirected;
        uint64_t no_data;
        uint64_t forwarded;
        uint64_t servfail;
        uint64_t dropped;
    };
    Counters counters() const;

    // 清空模式统计与全局计数
    void reset();

private:
    mutable std::mutex entries_mutex_;
    std::unordered_map<std::string, StatsEntry> entries_;

    // 统计计数器 (原子操作)
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> maintenance_{0};
    std::atomic<uint64_t> refused_{0};
    std::atomic<uint64_t> redirected_{0};
    std::atomic<uint64_t> no_data_{0};
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> servfail_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace dnsgate
