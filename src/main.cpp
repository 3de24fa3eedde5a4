#include "dnsgate/config.hpp"
#include "dnsgate/control_console.hpp"
#include "dnsgate/listener.hpp"
#include "dnsgate/logging.hpp"
#include "dnsgate/state_file.hpp"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace dnsgate;

namespace {

std::atomic<UdpListener*> g_listener{nullptr};

void handleSignal(int) {
    UdpListener* listener = g_listener.load();
    if (listener) {
        listener->stop();
    }
}

// 无法加载的规则放入 retained, 写回文件时保留
void loadState(const std::string& path, RuleStore& store, std::vector<PersistedRule>* retained) {
    if (path.empty()) {
        return;
    }

    auto log = logging::get();
    PersistedState state;
    Error err = StateFile::load(path, &state);
    if (err != Error::Success) {
        log->warn("{}: {}, starting with no rules", path, errorString(err));
        return;
    }

    std::vector<RejectedRule> rejected;
    auto snapshot = StateFile::buildSnapshot(state, &rejected);
    for (const auto& r : rejected) {
        log->warn("{}: skipped rule '{}' -> '{}': {}",
                  path, r.rule.pattern, r.rule.ip, errorString(r.error));
        retained->push_back(r.rule);
    }

    store.publish(snapshot);
    store.setMaintenance(state.maintenance);
    log->info("loaded {} rules from {}", snapshot->size(), path);
}

} // namespace

int main(int argc, char** argv) {
    ServerConfig config;
    std::string message;
    if (parseArguments(argc, argv, &config, &message) != Error::Success) {
        std::cerr << "Error: " << message << "\n\n" << usage();
        return 1;
    }
    if (config.show_help) {
        std::cout << usage();
        return 0;
    }

    if (!logging::init(config.log_level)) {
        std::cerr << "Error: unknown log level " << config.log_level << "\n";
        return 1;
    }
    auto log = logging::get();

    RuleStore store(config.maintenance_text);
    std::vector<PersistedRule> retained;
    loadState(config.state_file, store, &retained);

    StatsRecorder stats;
    QueryLog query_log(config.log_capacity);

    std::unique_ptr<UdpForwarder> forwarder;
    if (!config.upstreams.empty()) {
        forwarder = std::make_unique<UdpForwarder>(config.upstreams, config.upstream_timeout_ms);
        for (const auto& upstream : config.upstreams) {
            log->info("upstream {}", upstream.toString());
        }
    } else {
        log->warn("no upstream configured, unmatched queries get SERVFAIL");
    }

    QueryHandler handler(store, stats, query_log, forwarder.get(), config.answer_ttl);
    UdpListener listener(handler, stats, config.listener);

    Error err = listener.bind();
    if (err != Error::Success) {
        log->critical("cannot listen on {}:{}: {}",
                      config.listener.bind_address, config.listener.port, errorString(err));
        return 1;
    }

    g_listener.store(&listener);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    // 控制台线程在监听循环结束后停止并回收, 早于它引用的对象析构
    ControlConsole console(store, stats, query_log, config.state_file, std::cout);
    console.setRetainedRules(std::move(retained));
    console.setQuitHandler([&listener]() { listener.stop(); });
    std::thread console_thread;
    if (config.console) {
        console_thread = std::thread([&console]() { console.run(STDIN_FILENO); });
    }

    listener.run();
    g_listener.store(nullptr);

    console.stop();
    if (console_thread.joinable()) {
        console_thread.join();
    }

    log->info("dnsgate stopped");
    return 0;
}
