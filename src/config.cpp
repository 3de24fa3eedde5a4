#include "dnsgate/config.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

namespace dnsgate {

namespace {

template <typename T>
bool parseNumber(std::string_view value, T min, T max, T* out) {
    T result = 0;
    auto first = value.data();
    auto last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last || result < min || result > max) {
        return false;
    }
    *out = result;
    return true;
}

} // namespace

std::string usage() {
    return "Usage: dnsgate [options]\n"
           "  --bind <address>          listen address (default 0.0.0.0)\n"
           "  --port <number>           listen port (default 53)\n"
           "  --state-file <path>       persisted rules (default dnsgate.json, '-' for none)\n"
           "  --upstream <ip[:port]>    forward unmatched queries, repeatable\n"
           "  --timeout-ms <ms>         upstream timeout (default 2000)\n"
           "  --workers <n>             worker threads (default 4)\n"
           "  --queue <n>               pending datagram limit (default 1024)\n"
           "  --ttl <seconds>           TTL of synthesized answers (default 60)\n"
           "  --maintenance-text <txt>  TXT payload served in maintenance mode\n"
           "  --log-size <n>            recent queries kept (default 100)\n"
           "  --log-level <level>       trace|debug|info|warn|error|off\n"
           "  --no-console              do not read commands from stdin\n"
           "  --help\n";
}

Error parseArguments(int argc, char** argv, ServerConfig* out, std::string* message) {
    ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }
        if (arg == "--no-console") {
            config.console = false;
            continue;
        }

        if (i + 1 >= argc) {
            *message = arg + " requires a value";
            return Error::InvalidArgument;
        }
        std::string value = argv[++i];

        if (arg == "--bind") {
            config.listener.bind_address = value;
        } else if (arg == "--port") {
            if (!parseNumber<uint16_t>(value, 0, 65535, &config.listener.port)) {
                *message = "invalid port: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--state-file") {
            config.state_file = value == "-" ? std::string() : value;
        } else if (arg == "--upstream") {
            Upstream upstream;
            if (Upstream::parse(value, &upstream) != Error::Success) {
                *message = "invalid upstream: " + value;
                return Error::InvalidArgument;
            }
            config.upstreams.push_back(upstream);
        } else if (arg == "--timeout-ms") {
            if (!parseNumber<int>(value, 1, 60000, &config.upstream_timeout_ms)) {
                *message = "invalid timeout: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--workers") {
            if (!parseNumber<size_t>(value, 1, 256, &config.listener.workers)) {
                *message = "invalid worker count: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--queue") {
            if (!parseNumber<size_t>(value, 1, 1 << 20, &config.listener.queue_capacity)) {
                *message = "invalid queue size: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--ttl") {
            if (!parseNumber<uint32_t>(value, 0, 86400, &config.answer_ttl)) {
                *message = "invalid ttl: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--maintenance-text") {
            if (value.size() > MAX_MAINTENANCE_TEXT) {
                *message = "maintenance text longer than " + std::to_string(MAX_MAINTENANCE_TEXT) + " bytes";
                return Error::InvalidArgument;
            }
            config.maintenance_text = value;
        } else if (arg == "--log-size") {
            if (!parseNumber<size_t>(value, 1, 100000, &config.log_capacity)) {
                *message = "invalid log size: " + value;
                return Error::InvalidArgument;
            }
        } else if (arg == "--log-level") {
            config.log_level = value;
        } else {
            *message = "unknown option: " + arg;
            return Error::InvalidArgument;
        }
    }

    *out = std::move(config);
    return Error::Success;
}

} // namespace dnsgate
