#pragma once

#include "dns_parser.hpp"
#include "forwarder.hpp"
#include "matcher.hpp"
#include "query_log.hpp"
#include "rule_store.hpp"
#include "stats_recorder.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace dnsgate {

// 单个查询报文的处理流程: 解码 -> 维护模式/规则判定 -> 构建应答 -> 统计与记录
class QueryHandler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // forwarder 可以为空, 此时未命中的查询应答 SERVFAIL
    QueryHandler(
        RuleStore& store,
        StatsRecorder& stats,
        QueryLog& log,
        Forwarder* forwarder,
        uint32_t answer_ttl = DEFAULT_ANSWER_TTL
    );

    // 处理一个查询. 返回 Success 时 response 为待发送的应答;
    // 无法解码的报文返回对应错误码, 不产生应答
    Error handle(
        const uint8_t* query,
        size_t query_len,
        const std::string& client,
        std::vector<uint8_t>* response
    );

    // 测试用: 替换时钟
    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    Outcome answerBlocked(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        const Rule& rule,
        std::vector<uint8_t>* response,
        std::string* action
    );

    Outcome answerPassed(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        std::vector<uint8_t>* response,
        std::string* action
    );

    static void servFail(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        std::vector<uint8_t>* response
    );

    RuleStore& store_;
    StatsRecorder& stats_;
    QueryLog& log_;
    Forwarder* forwarder_;
    uint32_t answer_ttl_;
    Clock clock_;
};

} // namespace dnsgate
