#pragma once

#include "query_handler.hpp"
#include <sys/socket.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dnsgate {

// 固定线程数, 有界队列; 队列满时拒绝新任务
class WorkerPool {
public:
    WorkerPool(size_t threads, size_t queue_capacity);
    ~WorkerPool();

    // 禁止拷贝
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool submit(std::function<void()> task);

    // 执行完已入队的任务后退出
    void stop();

private:
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    size_t capacity_;
    bool stopping_;
};

struct ListenerOptions {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 53;
    size_t workers = 4;
    size_t queue_capacity = 1024;
};

// UDP 监听循环
class UdpListener {
public:
    UdpListener(QueryHandler& handler, StatsRecorder& stats, ListenerOptions options);
    ~UdpListener();

    // 禁止拷贝
    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    // 绑定失败为致命错误
    Error bind();

    // 阻塞直到 stop()
    void run();

    // 可在信号处理函数中调用
    void stop();

    // 实际绑定的端口 (port 为 0 时由系统分配)
    uint16_t boundPort() const { return bound_port_; }

private:
    void serve(std::vector<uint8_t> datagram, const sockaddr_storage& peer, socklen_t peer_len);

    QueryHandler& handler_;
    StatsRecorder& stats_;
    ListenerOptions options_;
    int fd_;
    uint16_t bound_port_;
    std::atomic<bool> running_;
    WorkerPool pool_;
};

} // namespace dnsgate
