#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cctype>

namespace dnsgate {

// 错误码
enum class Error : int {
    Success = 0,
    PacketTooShort = -1,
    InvalidHeader = -2,
    TruncatedMessage = -3,
    PointerLoop = -4,
    InvalidLabel = -5,
    BufferTooSmall = -6,
    NotQuery = -7,
    UnsupportedOpcode = -8,
    UnsupportedName = -9,

    // 规则校验
    InvalidPattern = -20,
    InvalidTarget = -21,
    InvalidWindow = -22,
    RuleNotFound = -23,

    // 转发与持久化
    NoUpstream = -40,
    UpstreamFailed = -41,
    StateFileUnreadable = -42,
    StateFileInvalid = -43,
    StateFileWriteFailed = -44,

    // 网络
    SocketError = -60,
    BindFailed = -61,
    SendFailed = -62,

    // 命令行
    InvalidArgument = -80,
};

const char* errorString(Error err);

// 网络字节序转换 (使用编译器内置函数)
// 不与 <netinet/in.h> 的 ntohs/htons 宏同名
inline uint16_t ntoh16(uint16_t n) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap16(n);
#else
    return n;
#endif
}

inline uint32_t ntoh32(uint32_t n) {
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return __builtin_bswap32(n);
#else
    return n;
#endif
}

inline uint16_t hton16(uint16_t h) {
    return ntoh16(h);
}

inline uint32_t hton32(uint32_t h) {
    return ntoh32(h);
}

// 非对齐读写 (网络字节序)
inline uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline void writeU16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

inline void writeU32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}

// DNS 类型
namespace dns_type {
    constexpr uint16_t A     = 1;
    constexpr uint16_t NS    = 2;
    constexpr uint16_t CNAME = 5;
    constexpr uint16_t SOA   = 6;
    constexpr uint16_t PTR   = 12;
    constexpr uint16_t MX    = 15;
    constexpr uint16_t TXT   = 16;
    constexpr uint16_t AAAA  = 28;
    constexpr uint16_t ANY   = 255;
}

const char* typeName(uint16_t qtype);

// DNS 类别
namespace dns_class {
    constexpr uint16_t IN = 1;
}

// DNS 响应码
namespace dns_rcode {
    constexpr uint8_t NOERROR  = 0;
    constexpr uint8_t FORMERR  = 1;
    constexpr uint8_t SERVFAIL = 2;
    constexpr uint8_t NXDOMAIN = 3;
    constexpr uint8_t NOTIMP   = 4;
    constexpr uint8_t REFUSED  = 5;
}

// 域名最大长度
constexpr size_t MAX_DOMAIN_LENGTH = 255;
constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_LABELS = 128;

// DNS 头部大小
constexpr size_t DNS_HEADER_SIZE = 12;

// 最小 DNS 查询大小: 头部 + 最小域名(1字节) + 类型(2) + 类别(2)
constexpr size_t MIN_DNS_QUERY_SIZE = DNS_HEADER_SIZE + 5;

// 一天的分钟数
constexpr uint16_t MINUTES_PER_DAY = 1440;

// 合成应答的默认 TTL
constexpr uint32_t DEFAULT_ANSWER_TTL = 60;

} // namespace dnsgate
