#pragma once

#include "common.hpp"
#include <string>
#include <vector>

namespace dnsgate {

// 未命中规则的查询交给转发器解析
class Forwarder {
public:
    virtual ~Forwarder() = default;

    // 转发原始查询, 成功时 response 为上游应答原文 (ID 与查询一致)
    virtual Error forward(
        const uint8_t* query,
        size_t query_len,
        std::vector<uint8_t>* response
    ) = 0;
};

struct Upstream {
    std::string host;   // IP 字面量
    uint16_t port = 53;

    // "1.1.1.1", "1.1.1.1:53", "2606:4700::1111", "[2606:4700::1111]:53"
    static Error parse(const std::string& text, Upstream* out);
    std::string toString() const;
};

constexpr int DEFAULT_UPSTREAM_TIMEOUT_MS = 2000;

// 依次尝试每个上游, 返回第一个 ID 匹配的应答
class UdpForwarder : public Forwarder {
public:
    UdpForwarder(std::vector<Upstream> upstreams, int timeout_ms = DEFAULT_UPSTREAM_TIMEOUT_MS);

    Error forward(
        const uint8_t* query,
        size_t query_len,
        std::vector<uint8_t>* response
    ) override;

    const std::vector<Upstream>& upstreams() const { return upstreams_; }

private:
    Error queryOne(
        const Upstream& upstream,
        const uint8_t* query,
        size_t query_len,
        std::vector<uint8_t>* response
    );

    std::vector<Upstream> upstreams_;
    int timeout_ms_;
};

} // namespace dnsgate
