#pragma once

#include "forwarder.hpp"
#include "listener.hpp"
#include "query_log.hpp"
#include "rule_store.hpp"
#include <string>
#include <vector>

namespace dnsgate {

// 维护提示的长度上限, 保证 TXT 应答不超过 512 字节
constexpr size_t MAX_MAINTENANCE_TEXT = 200;

struct ServerConfig {
    ListenerOptions listener;
    std::string state_file = "dnsgate.json";
    std::vector<Upstream> upstreams;
    int upstream_timeout_ms = DEFAULT_UPSTREAM_TIMEOUT_MS;
    uint32_t answer_ttl = DEFAULT_ANSWER_TTL;
    std::string maintenance_text = DEFAULT_MAINTENANCE_TEXT;
    size_t log_capacity = DEFAULT_QUERY_LOG_CAPACITY;
    std::string log_level = "info";
    bool console = true;
    bool show_help = false;
};

// 解析命令行, 失败时 message 为错误说明
Error parseArguments(int argc, char** argv, ServerConfig* out, std::string* message);

std::string usage();

} // namespace dnsgate
