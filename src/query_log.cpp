#include "dnsgate/query_log.hpp"

#include <ctime>

namespace dnsgate {

QueryLog::QueryLog(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void QueryLog::append(QueryLogEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<QueryLogEntry> QueryLog::recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<QueryLogEntry>(entries_.begin(), entries_.end());
}

void QueryLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::string QueryLog::formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace dnsgate
