#include "dnsgate/forwarder.hpp"
#include "dnsgate/logging.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>

namespace dnsgate {

namespace {

// 作用域结束时关闭套接字
struct SocketGuard {
    int fd;
    explicit SocketGuard(int f) : fd(f) {}
    ~SocketGuard() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
};

bool parsePort(const std::string& text, uint16_t* port) {
    if (text.empty() || text.size() > 5) return false;
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return false;
    *port = static_cast<uint16_t>(value);
    return true;
}

bool makeAddress(const Upstream& upstream, sockaddr_storage* storage, socklen_t* length) {
    std::memset(storage, 0, sizeof(*storage));

    auto* v4 = reinterpret_cast<sockaddr_in*>(storage);
    if (::inet_pton(AF_INET, upstream.host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = hton16(upstream.port);
        *length = sizeof(sockaddr_in);
        return true;
    }

    auto* v6 = reinterpret_cast<sockaddr_in6*>(storage);
    if (::inet_pton(AF_INET6, upstream.host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = hton16(upstream.port);
        *length = sizeof(sockaddr_in6);
        return true;
    }

    return false;
}

} // namespace

// ==================== Upstream ====================

Error Upstream::parse(const std::string& text, Upstream* out) {
    Upstream upstream;
    std::string host = text;

    if (!text.empty() && text[0] == '[') {
        // [v6]:port
        auto close = text.find(']');
        if (close == std::string::npos) {
            return Error::InvalidArgument;
        }
        host = text.substr(1, close - 1);
        if (close + 1 < text.size()) {
            if (text[close + 1] != ':' || !parsePort(text.substr(close + 2), &upstream.port)) {
                return Error::InvalidArgument;
            }
        }
    } else if (text.find(':') != std::string::npos && text.find(':') == text.rfind(':')) {
        // v4:port
        auto colon = text.find(':');
        host = text.substr(0, colon);
        if (!parsePort(text.substr(colon + 1), &upstream.port)) {
            return Error::InvalidArgument;
        }
    }

    upstream.host = host;
    sockaddr_storage storage;
    socklen_t length = 0;
    if (!makeAddress(upstream, &storage, &length)) {
        return Error::InvalidArgument;
    }

    *out = upstream;
    return Error::Success;
}

std::string Upstream::toString() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// ==================== UdpForwarder ====================

UdpForwarder::UdpForwarder(std::vector<Upstream> upstreams, int timeout_ms)
    : upstreams_(std::move(upstreams)),
      timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_UPSTREAM_TIMEOUT_MS) {}

Error UdpForwarder::forward(
    const uint8_t* query,
    size_t query_len,
    std::vector<uint8_t>* response
) {
    if (upstreams_.empty()) {
        return Error::NoUpstream;
    }
    if (!query || query_len < DNS_HEADER_SIZE) {
        return Error::PacketTooShort;
    }

    for (const auto& upstream : upstreams_) {
        Error err = queryOne(upstream, query, query_len, response);
        if (err == Error::Success) {
            return Error::Success;
        }
        logging::get()->debug("upstream {} failed: {}", upstream.toString(), errorString(err));
    }
    return Error::UpstreamFailed;
}

Error UdpForwarder::queryOne(
    const Upstream& upstream,
    const uint8_t* query,
    size_t query_len,
    std::vector<uint8_t>* response
) {
    sockaddr_storage storage;
    socklen_t length = 0;
    if (!makeAddress(upstream, &storage, &length)) {
        return Error::InvalidArgument;
    }

    SocketGuard sock(::socket(storage.ss_family, SOCK_DGRAM, 0));
    if (sock.fd < 0) {
        return Error::SocketError;
    }

    // connect 后只接收来自该上游的报文
    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&storage), length) != 0) {
        return Error::SocketError;
    }

    if (::send(sock.fd, query, query_len, 0) != static_cast<ssize_t>(query_len)) {
        return Error::SendFailed;
    }

    // 整个等待共用一个截止时间, 丢弃的报文不会延长等待
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::vector<uint8_t> buffer(65536);

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        pollfd pfd;
        pfd.fd = sock.fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::UpstreamFailed;
        }
        if (ready == 0) {
            break;
        }

        ssize_t received = ::recv(sock.fd, buffer.data(), buffer.size(), MSG_DONTWAIT);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return Error::UpstreamFailed;
        }

        // 丢弃 ID 不匹配或不是应答的报文
        if (static_cast<size_t>(received) < DNS_HEADER_SIZE ||
            buffer[0] != query[0] || buffer[1] != query[1] ||
            (buffer[2] & 0x80) == 0) {
            continue;
        }

        response->assign(buffer.begin(), buffer.begin() + received);
        return Error::Success;
    }

    return Error::UpstreamFailed;
}

} // namespace dnsgate
