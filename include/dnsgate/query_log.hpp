#pragma once

#include "common.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace dnsgate {

struct QueryLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string client;
    std::string name;
    uint16_t qtype = 0;
    std::string action;
};

constexpr size_t DEFAULT_QUERY_LOG_CAPACITY = 100;

// 最近查询记录, 超出容量时丢弃最旧的条目
class QueryLog {
public:
    explicit QueryLog(size_t capacity = DEFAULT_QUERY_LOG_CAPACITY);

    void append(QueryLogEntry entry);

    // 从旧到新
    std::vector<QueryLogEntry> recent() const;

    void clear();
    size_t capacity() const { return capacity_; }

    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

private:
    mutable std::mutex mutex_;
    std::deque<QueryLogEntry> entries_;
    const size_t capacity_;
};

} // namespace dnsgate
