#include "dnsgate/stats_recorder.hpp"

namespace dnsgate {

// ==================== StatsRecorder ====================

void StatsRecorder::recordMatch(
    const std::string& pattern,
    std::chrono::system_clock::time_point when
) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    StatsEntry& entry = entries_[pattern];
    entry.count++;
    if (when > entry.last_matched) {
        entry.last_matched = when;
    }
}

void StatsRecorder::recordOutcome(Outcome outcome) {
    if (outcome != Outcome::Dropped) {
        queries_.fetch_add(1, std::memory_order_relaxed);
    }

    switch (outcome) {
        case Outcome::Maintenance:
            maintenance_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::Refused:
            refused_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::Redirected:
            redirected_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::NoData:
            no_data_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::Forwarded:
            forwarded_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::ServFail:
            servfail_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Outcome::Dropped:
            dropped_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

std::map<std::string, StatsEntry> StatsRecorder::snapshot() const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    return std::map<std::string, StatsEntry>(entries_.begin(), entries_.end());
}

StatsRecorder::Counters StatsRecorder::counters() const {
    return Counters{
        queries_.load(std::memory_order_relaxed),
        maintenance_.load(std::memory_order_relaxed),
        refused_.load(std::memory_order_relaxed),
        redirected_.load(std::memory_order_relaxed),
        no_data_.load(std::memory_order_relaxed),
        forwarded_.load(std::memory_order_relaxed),
        servfail_.load(std::memory_order_relaxed),
        dropped_.load(std::memory_order_relaxed)
    };
}

void StatsRecorder::reset() {
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        entries_.clear();
    }

    queries_.store(0, std::memory_order_relaxed);
    maintenance_.store(0, std::memory_order_relaxed);
    refused_.store(0, std::memory_order_relaxed);
    redirected_.store(0, std::memory_order_relaxed);
    no_data_.store(0, std::memory_order_relaxed);
    forwarded_.store(0, std::memory_order_relaxed);
    servfail_.store(0, std::memory_order_relaxed);
    dropped_.store(0, std::memory_order_relaxed);
}

} // namespace dnsgate
