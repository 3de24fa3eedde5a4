#include <gtest/gtest.h>
#include "dnsgate/forwarder.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <thread>

using namespace dnsgate;

namespace {

// 本地 UDP 上游, 收到查询后交给 reply 回调决定如何应答
class FakeUpstream {
public:
    FakeUpstream() : fd_(::socket(AF_INET, SOCK_DGRAM, 0)), port_(0) {
        struct timeval tv;
        tv.tv_sec = 2;
        tv.tv_usec = 0;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            socklen_t len = sizeof(addr);
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntoh16(addr.sin_port);
        }
    }

    ~FakeUpstream() {
        if (thread_.joinable()) thread_.join();
        if (fd_ >= 0) ::close(fd_);
    }

    // 接收一个查询后在后台执行 reply
    void serveOnce(std::function<void(int, const std::vector<uint8_t>&, const sockaddr_in&)> reply) {
        thread_ = std::thread([this, reply]() {
            std::vector<uint8_t> buffer(1500);
            sockaddr_in peer;
            socklen_t peer_len = sizeof(peer);
            ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&peer), &peer_len);
            if (n <= 0) {
                return;
            }
            buffer.resize(static_cast<size_t>(n));
            reply(fd_, buffer, peer);
        });
    }

    uint16_t port() const { return port_; }

private:
    int fd_;
    uint16_t port_;
    std::thread thread_;
};

void sendTo(int fd, std::vector<uint8_t> data, const sockaddr_in& peer) {
    ::sendto(fd, data.data(), data.size(), 0,
             reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
}

std::vector<uint8_t> asResponse(std::vector<uint8_t> query, uint16_t id) {
    query[0] = static_cast<uint8_t>(id >> 8);
    query[1] = static_cast<uint8_t>(id & 0xFF);
    query[2] |= 0x80;
    return query;
}

const std::vector<uint8_t> kQuery = {
    0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x00, 0x00, 0x01, 0x00, 0x01
};

} // namespace

TEST(UpstreamTest, Parse) {
    Upstream upstream;
    ASSERT_EQ(Upstream::parse("127.0.0.1:5300", &upstream), Error::Success);
    EXPECT_EQ(upstream.host, "127.0.0.1");
    EXPECT_EQ(upstream.port, 5300);
    EXPECT_EQ(upstream.toString(), "127.0.0.1:5300");

    ASSERT_EQ(Upstream::parse("[::1]:53", &upstream), Error::Success);
    EXPECT_EQ(upstream.toString(), "[::1]:53");

    EXPECT_EQ(Upstream::parse("dns.example", &upstream), Error::InvalidArgument);
}

TEST(UdpForwarderTest, NoUpstream) {
    UdpForwarder forwarder(std::vector<Upstream>{});
    std::vector<uint8_t> response;
    EXPECT_EQ(forwarder.forward(kQuery.data(), kQuery.size(), &response), Error::NoUpstream);
}

TEST(UdpForwarderTest, SkipsMismatchedIdAndReturnsMatchingReply) {
    FakeUpstream upstream;
    ASSERT_NE(upstream.port(), 0);
    upstream.serveOnce([](int fd, const std::vector<uint8_t>& query, const sockaddr_in& peer) {
        sendTo(fd, asResponse(query, 0x9999), peer);
        auto good = asResponse(query, 0x1234);
        good.push_back(0xAA);
        sendTo(fd, good, peer);
    });

    UdpForwarder forwarder({Upstream{"127.0.0.1", upstream.port()}}, 1000);
    std::vector<uint8_t> response;
    ASSERT_EQ(forwarder.forward(kQuery.data(), kQuery.size(), &response), Error::Success);
    ASSERT_EQ(response.size(), kQuery.size() + 1);
    EXPECT_EQ(response[0], 0x12);
    EXPECT_EQ(response[1], 0x34);
    EXPECT_EQ(response.back(), 0xAA);
}

// 截止时间前到达的无关报文不会让等待超过超时时间
TEST(UdpForwarderTest, MismatchedReplyDoesNotExtendTimeout) {
    FakeUpstream upstream;
    ASSERT_NE(upstream.port(), 0);
    upstream.serveOnce([](int fd, const std::vector<uint8_t>& query, const sockaddr_in& peer) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        sendTo(fd, asResponse(query, 0x9999), peer);
    });

    UdpForwarder forwarder({Upstream{"127.0.0.1", upstream.port()}}, 400);
    std::vector<uint8_t> response;

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(forwarder.forward(kQuery.data(), kQuery.size(), &response), Error::UpstreamFailed);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_GE(elapsed, 350);
    EXPECT_LT(elapsed, 650);
}
