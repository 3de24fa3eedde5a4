#include "dnsgate/listener.hpp"
#include "dnsgate/logging.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

namespace dnsgate {

namespace {

// 接收超时, 用于周期性检查 running_
constexpr int RECEIVE_POLL_MS = 250;

std::string formatPeer(const sockaddr_storage& peer) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (peer.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&peer);
        ::inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(ntoh16(v4->sin_port));
    }
    if (peer.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&peer);
        ::inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
        return "[" + std::string(buf) + "]:" + std::to_string(ntoh16(v6->sin6_port));
    }
    return "unknown";
}

} // namespace

// ==================== WorkerPool ====================

WorkerPool::WorkerPool(size_t threads, size_t queue_capacity)
    : capacity_(queue_capacity == 0 ? 1 : queue_capacity), stopping_(false) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; i++) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || tasks_.size() >= capacity_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

// ==================== UdpListener ====================

UdpListener::UdpListener(QueryHandler& handler, StatsRecorder& stats, ListenerOptions options)
    : handler_(handler),
      stats_(stats),
      options_(std::move(options)),
      fd_(-1),
      bound_port_(0),
      running_(false),
      pool_(options_.workers, options_.queue_capacity) {}

UdpListener::~UdpListener() {
    stop();
    pool_.stop();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Error UdpListener::bind() {
    sockaddr_storage storage;
    std::memset(&storage, 0, sizeof(storage));
    socklen_t length = 0;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&storage);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&storage);
    if (::inet_pton(AF_INET, options_.bind_address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = hton16(options_.port);
        length = sizeof(sockaddr_in);
    } else if (::inet_pton(AF_INET6, options_.bind_address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = hton16(options_.port);
        length = sizeof(sockaddr_in6);
    } else {
        logging::get()->error("invalid bind address '{}'", options_.bind_address);
        return Error::BindFailed;
    }

    fd_ = ::socket(storage.ss_family, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        logging::get()->error("failed to create UDP socket: {}", std::strerror(errno));
        return Error::SocketError;
    }

    int reuse = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = RECEIVE_POLL_MS * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        logging::get()->error("failed to set receive timeout: {}", std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return Error::SocketError;
    }

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&storage), length) != 0) {
        logging::get()->error("failed to bind {}:{}: {}",
                              options_.bind_address, options_.port, std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return Error::BindFailed;
    }

    sockaddr_storage actual;
    socklen_t actual_len = sizeof(actual);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&actual), &actual_len) == 0) {
        bound_port_ = actual.ss_family == AF_INET
            ? ntoh16(reinterpret_cast<sockaddr_in*>(&actual)->sin_port)
            : ntoh16(reinterpret_cast<sockaddr_in6*>(&actual)->sin6_port);
    } else {
        bound_port_ = options_.port;
    }

    running_.store(true);
    logging::get()->info("listening on {}:{} (udp, {} workers)",
                         options_.bind_address, bound_port_, options_.workers);
    return Error::Success;
}

void UdpListener::run() {
    if (fd_ < 0) {
        return;
    }

    std::vector<uint8_t> buffer(65536);
    while (running_.load()) {
        sockaddr_storage peer;
        socklen_t peer_len = sizeof(peer);
        ssize_t received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                      reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            logging::get()->warn("recvfrom failed: {}", std::strerror(errno));
            continue;
        }

        std::vector<uint8_t> datagram(buffer.begin(), buffer.begin() + received);
        bool queued = pool_.submit([this, data = std::move(datagram), peer, peer_len]() mutable {
            serve(std::move(data), peer, peer_len);
        });
        if (!queued) {
            stats_.recordOutcome(Outcome::Dropped);
            logging::get()->warn("worker queue full, dropped datagram from {}", formatPeer(peer));
        }
    }
    logging::get()->info("listener stopped");
}

void UdpListener::stop() {
    running_.store(false);
}

void UdpListener::serve(std::vector<uint8_t> datagram, const sockaddr_storage& peer, socklen_t peer_len) {
    std::string client = formatPeer(peer);
    std::vector<uint8_t> response;

    Error err = handler_.handle(datagram.data(), datagram.size(), client, &response);
    if (err != Error::Success || response.empty()) {
        return;
    }

    ssize_t sent = ::sendto(fd_, response.data(), response.size(), 0,
                            reinterpret_cast<const sockaddr*>(&peer), peer_len);
    if (sent != static_cast<ssize_t>(response.size())) {
        logging::get()->warn("failed to send response to {}: {}", client, std::strerror(errno));
    }
}

} // namespace dnsgate
