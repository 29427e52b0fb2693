#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace clawguard {

class Logger {
public:
    static void init(std::string_view name = "clawguard", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

/// Maps a textual level ("trace".."critical") to spdlog; unknown -> info.
auto parse_log_level(std::string_view level) -> spdlog::level::level_enum;

} // namespace clawguard

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::clawguard::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::clawguard::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::clawguard::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::clawguard::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::clawguard::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::clawguard::Logger::get(), __VA_ARGS__)
