#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace dnsgate {
namespace logging {

constexpr const char* LOGGER_NAME = "dnsgate";

// 设置级别 ("trace", "debug", "info", "warn", "error", "off")
// 未知的级别名返回 false, 级别保持不变
bool init(const std::string& level);

// 进程内共享的日志器, 首次调用时创建
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace dnsgate
