#include "clawguard/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace clawguard {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

auto parse_log_level(std::string_view level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logger::init(std::string_view name, std::string_view level) {
    // Diagnostics go to stderr so `clawguard fetch` output stays pipeable.
    auto existing = spdlog::get(std::string(name));
    g_logger = existing ? existing : spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_log_level(level));
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace clawguard
