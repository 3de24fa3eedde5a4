#include "dnsgate/query_handler.hpp"
#include "dnsgate/logging.hpp"

namespace dnsgate {

namespace {

// 合成应答的缓冲区上限
constexpr size_t RESPONSE_BUFFER_SIZE = 4096;

} // namespace

QueryHandler::QueryHandler(
    RuleStore& store,
    StatsRecorder& stats,
    QueryLog& log,
    Forwarder* forwarder,
    uint32_t answer_ttl
)
    : store_(store),
      stats_(stats),
      log_(log),
      forwarder_(forwarder),
      answer_ttl_(answer_ttl),
      clock_([] { return std::chrono::system_clock::now(); }) {}

Error QueryHandler::handle(
    const uint8_t* query,
    size_t query_len,
    const std::string& client,
    std::vector<uint8_t>* response
) {
    DNSParseResult parsed;
    Error err = DNSParser::parseQuery(query, query_len, &parsed);
    if (err != Error::Success) {
        stats_.recordOutcome(Outcome::Dropped);
        logging::get()->debug("dropped datagram from {}: {}", client, errorString(err));
        return err;
    }

    std::string name;
    err = DNSParser::questionName(query, query_len, parsed, &name);
    if (err != Error::Success && err != Error::UnsupportedName) {
        stats_.recordOutcome(Outcome::Dropped);
        logging::get()->debug("dropped datagram from {}: {}", client, errorString(err));
        return err;
    }
    // 标签内含 '.' 的名字无法与规则可靠比较, 一律拒绝
    bool unsupported_name = err == Error::UnsupportedName;

    auto now = clock_();
    std::string action;
    Outcome outcome;

    if (store_.maintenance()) {
        // 维护模式: 不论类型与规则, 一律返回 TXT 提示
        const std::string& text = store_.maintenanceText();
        response->resize(RESPONSE_BUFFER_SIZE);
        size_t len = DNSResponseBuilder::buildTXTResponse(
            query, query_len, parsed,
            text.data(), text.size(), answer_ttl_,
            response->data(), response->size()
        );
        if (len > 0) {
            response->resize(len);
            outcome = Outcome::Maintenance;
            action = "maintenance mode";
        } else {
            servFail(query, query_len, parsed, response);
            outcome = Outcome::ServFail;
            action = "servfail (maintenance text too long)";
        }
    } else if (unsupported_name) {
        response->resize(RESPONSE_BUFFER_SIZE);
        size_t len = DNSResponseBuilder::buildRefused(
            query, query_len, parsed, response->data(), response->size());
        response->resize(len);
        outcome = Outcome::Refused;
        action = std::string("refused (") + errorString(err) + ")";
    } else {
        // 快照在本次判定期间保持有效
        SnapshotPtr snapshot = store_.currentSnapshot();
        Decision decision = Matcher::decide(name, *snapshot, Matcher::minuteOfDay(now));

        if (decision.isBlock()) {
            stats_.recordMatch(decision.rule->pattern(), now);
            outcome = answerBlocked(query, query_len, parsed, *decision.rule, response, &action);
        } else {
            outcome = answerPassed(query, query_len, parsed, response, &action);
        }
    }

    stats_.recordOutcome(outcome);

    const char* qtype = typeName(parsed.question.qtype);
    if (outcome == Outcome::Refused || outcome == Outcome::Redirected || outcome == Outcome::NoData) {
        logging::get()->info("{} {} ({}): {}", client, name, qtype, action);
    } else {
        logging::get()->debug("{} {} ({}): {}", client, name, qtype, action);
    }

    QueryLogEntry entry;
    entry.timestamp = now;
    entry.client = client;
    entry.name = std::move(name);
    entry.qtype = parsed.question.qtype;
    entry.action = std::move(action);
    log_.append(std::move(entry));

    return Error::Success;
}

Outcome QueryHandler::answerBlocked(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    const Rule& rule,
    std::vector<uint8_t>* response,
    std::string* action
) {
    const Target& target = rule.target();
    uint16_t qtype = parsed.question.qtype;
    response->resize(RESPONSE_BUFFER_SIZE);
    size_t len = 0;
    Outcome outcome;

    if (target.isRefuse()) {
        len = DNSResponseBuilder::buildRefused(
            query, query_len, parsed, response->data(), response->size());
        outcome = Outcome::Refused;
        *action = "refused @ " + rule.pattern();
    } else if (target.kind == TargetKind::IPv4 && qtype == dns_type::A) {
        len = DNSResponseBuilder::buildAResponse(
            query, query_len, parsed, target.ipv4, answer_ttl_,
            response->data(), response->size());
        outcome = Outcome::Redirected;
        *action = "redirect to " + target.text + " @ " + rule.pattern();
    } else if (target.kind == TargetKind::IPv6 && qtype == dns_type::AAAA) {
        len = DNSResponseBuilder::buildAAAAResponse(
            query, query_len, parsed, target.ipv6, answer_ttl_,
            response->data(), response->size());
        outcome = Outcome::Redirected;
        *action = "redirect to " + target.text + " @ " + rule.pattern();
    } else {
        // 地址族与查询类型不符: 空应答而不是错误
        len = DNSResponseBuilder::buildNoData(
            query, query_len, parsed, response->data(), response->size());
        outcome = Outcome::NoData;
        *action = "no " + std::string(typeName(qtype)) + " record for " +
                  target.text + " @ " + rule.pattern();
    }

    if (len == 0) {
        servFail(query, query_len, parsed, response);
        return Outcome::ServFail;
    }
    response->resize(len);
    return outcome;
}

Outcome QueryHandler::answerPassed(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    std::vector<uint8_t>* response,
    std::string* action
) {
    if (!forwarder_) {
        servFail(query, query_len, parsed, response);
        *action = "servfail (no upstream)";
        return Outcome::ServFail;
    }

    Error err = forwarder_->forward(query, query_len, response);
    if (err != Error::Success) {
        logging::get()->warn("forwarding failed: {}", errorString(err));
        servFail(query, query_len, parsed, response);
        *action = std::string("servfail (") + errorString(err) + ")";
        return Outcome::ServFail;
    }

    *action = "forwarded";
    return Outcome::Forwarded;
}

void QueryHandler::servFail(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    std::vector<uint8_t>* response
) {
    response->resize(RESPONSE_BUFFER_SIZE);
    size_t len = DNSResponseBuilder::buildServFail(
        query, query_len, parsed, response->data(), response->size());
    response->resize(len);
}

} // namespace dnsgate
