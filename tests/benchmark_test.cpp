#include <benchmark/benchmark.h>
#include "dnsgate/dns_parser.hpp"
#include "dnsgate/logging.hpp"
#include "dnsgate/matcher.hpp"
#include "dnsgate/query_handler.hpp"
#include <vector>

using namespace dnsgate;

// 构造 DNS 查询包
std::vector<uint8_t> buildQuery(const std::string& domain) {
    std::vector<uint8_t> packet = {
        0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    };

    size_t start = 0;
    for (size_t i = 0; i <= domain.size(); i++) {
        if (i == domain.size() || domain[i] == '.') {
            size_t len = i - start;
            packet.push_back(static_cast<uint8_t>(len));
            for (size_t j = start; j < i; j++) {
                packet.push_back(domain[j]);
            }
            start = i + 1;
        }
    }
    packet.push_back(0);
    packet.insert(packet.end(), {0x00, 0x01, 0x00, 0x01});

    return packet;
}

// 1000 条精确规则 + 若干通配符
SnapshotPtr buildSnapshot() {
    std::vector<Rule> rules;
    for (int i = 0; i < 1000; i++) {
        std::optional<Rule> rule;
        std::string pattern = "domain" + std::to_string(i) + ".example.com";
        if (Rule::create(pattern, "REFUSED", TimeWindow(), true, &rule) == Error::Success) {
            rules.push_back(*rule);
        }
    }
    for (const char* pattern : {"*.test.com", "*.ads.example.com", "*.example.com"}) {
        std::optional<Rule> rule;
        if (Rule::create(pattern, "0.0.0.0", TimeWindow(22 * 60, 6 * 60), true, &rule) == Error::Success) {
            rules.push_back(*rule);
        }
    }
    return std::make_shared<const RuleSnapshot>(std::move(rules), 1);
}

// ==================== DNS 解析基准测试 ====================

static void BM_DNSParse(benchmark::State& state) {
    auto packet = buildQuery("www.example.com");

    for (auto _ : state) {
        DNSParseResult result;
        auto err = DNSParser::parseQuery(packet.data(), packet.size(), &result);
        benchmark::DoNotOptimize(err);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DNSParse);

static void BM_DNSQuestionName(benchmark::State& state) {
    auto packet = buildQuery("subdomain.example.com");
    DNSParseResult parsed;
    DNSParser::parse(packet.data(), packet.size(), &parsed);

    std::string name;

    for (auto _ : state) {
        DNSParser::questionName(packet.data(), packet.size(), parsed, &name);
        benchmark::DoNotOptimize(name);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DNSQuestionName);

// ==================== 规则匹配基准测试 ====================

static void BM_MatchExact(benchmark::State& state) {
    auto snapshot = buildSnapshot();

    for (auto _ : state) {
        auto decision = Matcher::decide("domain500.example.com.", *snapshot, 12 * 60);
        benchmark::DoNotOptimize(decision);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MatchExact);

static void BM_MatchWildcard(benchmark::State& state) {
    auto snapshot = buildSnapshot();

    for (auto _ : state) {
        auto decision = Matcher::decide("x.sub.ads.example.com.", *snapshot, 23 * 60);
        benchmark::DoNotOptimize(decision);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MatchWildcard);

static void BM_MatchMiss(benchmark::State& state) {
    auto snapshot = buildSnapshot();

    for (auto _ : state) {
        auto decision = Matcher::decide("www.unrelated.org.", *snapshot, 12 * 60);
        benchmark::DoNotOptimize(decision);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MatchMiss);

// ==================== 响应构建基准测试 ====================

static void BM_BuildRefused(benchmark::State& state) {
    auto query = buildQuery("blocked.example.com");
    DNSParseResult parsed;
    DNSParser::parse(query.data(), query.size(), &parsed);

    uint8_t response[512];

    for (auto _ : state) {
        size_t len = DNSResponseBuilder::buildRefused(
            query.data(), query.size(), parsed,
            response, sizeof(response)
        );
        benchmark::DoNotOptimize(len);
        benchmark::DoNotOptimize(response);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildRefused);

static void BM_BuildAResponse(benchmark::State& state) {
    auto query = buildQuery("redirect.example.com");
    DNSParseResult parsed;
    DNSParser::parse(query.data(), query.size(), &parsed);

    uint32_t ip = hton32(0xC0A80164);
    uint8_t response[512];

    for (auto _ : state) {
        size_t len = DNSResponseBuilder::buildAResponse(
            query.data(), query.size(), parsed,
            ip, 60,
            response, sizeof(response)
        );
        benchmark::DoNotOptimize(len);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildAResponse);

// ==================== 完整查询处理 ====================

static void BM_HandleBlockedQuery(benchmark::State& state) {
    logging::init("off");

    RuleStore store;
    store.publish(buildSnapshot());
    StatsRecorder stats;
    QueryLog log;
    QueryHandler handler(store, stats, log, nullptr);

    auto query = buildQuery("domain42.example.com");
    std::vector<uint8_t> response;

    for (auto _ : state) {
        auto err = handler.handle(query.data(), query.size(), "127.0.0.1:53000", &response);
        benchmark::DoNotOptimize(err);
        benchmark::DoNotOptimize(response.data());
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HandleBlockedQuery);

BENCHMARK_MAIN();
