#include "dnsgate/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dnsgate {
namespace logging {

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
        return created;
    }();
    return logger;
}

bool init(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str 对未知名字返回 off
    if (lvl == spdlog::level::off && level != "off") {
        return false;
    }
    get()->set_level(lvl);
    return true;
}

} // namespace logging
} // namespace dnsgate
