#pragma once

#include "common.hpp"
#include <string>

namespace dnsgate {

// DNS 头部结构 (网络字节序)
struct DNSHeader {
    uint16_t id;
    uint16_t flags;
    uint16_t qd_count;
    uint16_t an_count;
    uint16_t ns_count;
    uint16_t ar_count;

    // 获取解析后的值
    uint16_t getId() const { return ntoh16(id); }
    uint16_t getFlags() const { return ntoh16(flags); }
    uint16_t getQDCount() const { return ntoh16(qd_count); }
    uint16_t getANCount() const { return ntoh16(an_count); }

    // 标志位检查
    bool isQuery() const { return (getFlags() & 0x8000) == 0; }
    bool isResponse() const { return !isQuery(); }
    uint8_t getOpcode() const { return static_cast<uint8_t>((getFlags() >> 11) & 0x0F); }
    uint8_t getRCode() const { return getFlags() & 0x000F; }
    bool isAuthoritative() const { return (getFlags() & 0x0400) != 0; }
    bool isRecursionDesired() const { return (getFlags() & 0x0100) != 0; }
} __attribute__((packed));

static_assert(sizeof(DNSHeader) == 12, "DNSHeader size must be 12 bytes");

// DNS 问题结构 (零拷贝)
struct DNSQuestion {
    size_t name_offset;          // 相对于包开始的偏移
    uint16_t qtype;
    uint16_t qclass;
};

// DNS 解析结果
struct DNSParseResult {
    const DNSHeader* header;
    DNSQuestion question;
    size_t question_end;         // 问题部分结束位置
    uint16_t id;                 // DNS ID (主机字节序)
    uint16_t flags;              // DNS flags (主机字节序)
    bool is_query;               // 是否是查询
};

// DNS 解析器类
class DNSParser {
public:
    // 解析 DNS 报文 (只解析第一个问题)
    static Error parse(
        const uint8_t* data,
        size_t len,
        DNSParseResult* result
    );

    // 解析并校验标准查询: QR=0, OPCODE=QUERY, QDCOUNT=1
    static Error parseQuery(
        const uint8_t* data,
        size_t len,
        DNSParseResult* result
    );

    // 解码域名到缓冲区 (小写, 不含结尾的点)
    // 标签内含 '.' 时仍写出结果, 返回 UnsupportedName
    static Error decodeName(
        const uint8_t* packet,
        size_t packet_len,
        size_t name_offset,
        char* out_buf,
        size_t buf_size,
        size_t* out_len
    );

    // 解码问题域名为规范形式 (小写, 单个结尾的点), 错误码同 decodeName
    static Error questionName(
        const uint8_t* packet,
        size_t packet_len,
        const DNSParseResult& parsed,
        std::string* out
    );

private:
    // 解析域名，返回结束位置
    static Error parseName(
        const uint8_t* data,
        size_t len,
        size_t offset,
        size_t* end_offset
    );
};

// DNS 响应构建器
//
// 所有构建函数复制查询的头部与问题部分, 回写 ID, 返回写入的字节数;
// 缓冲区不足时返回 0.
class DNSResponseBuilder {
public:
    // 构建 REFUSED 响应
    static size_t buildRefused(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        uint8_t* response,
        size_t response_buf_size
    );

    // 构建 SERVFAIL 响应
    static size_t buildServFail(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        uint8_t* response,
        size_t response_buf_size
    );

    // 构建 NOERROR 空应答 (该类型无记录)
    static size_t buildNoData(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        uint8_t* response,
        size_t response_buf_size
    );

    // 构建 A 记录响应
    static size_t buildAResponse(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        uint32_t ip,           // 网络字节序
        uint32_t ttl,
        uint8_t* response,
        size_t response_buf_size
    );

    // 构建 AAAA 记录响应 (IPv6)
    static size_t buildAAAAResponse(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        const uint8_t* ipv6,   // 16 字节, 网络字节序
        uint32_t ttl,
        uint8_t* response,
        size_t response_buf_size
    );

    // 构建 TXT 记录响应, 文本按 255 字节切分为多个字符串
    static size_t buildTXTResponse(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        const char* text,
        size_t text_len,
        uint32_t ttl,
        uint8_t* response,
        size_t response_buf_size
    );

private:
    // 复制头部与问题部分并改写标志位, 返回问题部分结束位置
    static size_t copyQuestion(
        const uint8_t* query,
        const DNSParseResult& parsed,
        uint8_t rcode,
        bool authoritative,
        uint16_t an_count,
        uint8_t* response,
        size_t response_buf_size
    );

    // 写入应答记录头 (名字指针 + 类型 + 类别 + TTL + RDLENGTH), 类别与问题一致
    static size_t writeAnswerHeader(
        uint8_t* response,
        size_t offset,
        const DNSParseResult& parsed,
        uint16_t type,
        uint32_t ttl,
        uint16_t rdlength
    );
};

} // namespace dnsgate
