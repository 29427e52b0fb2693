#include <catch2/catch_test_macros.hpp>

#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

#include "clawguard/core/logger.hpp"

using clawguard::Logger;

TEST_CASE("parse_log_level maps names to spdlog levels", "[core][logger]") {
    CHECK(clawguard::parse_log_level("trace") == spdlog::level::trace);
    CHECK(clawguard::parse_log_level("debug") == spdlog::level::debug);
    CHECK(clawguard::parse_log_level("warn") == spdlog::level::warn);
    CHECK(clawguard::parse_log_level("error") == spdlog::level::err);
    CHECK(clawguard::parse_log_level("off") == spdlog::level::off);
    CHECK(clawguard::parse_log_level("bogus") == spdlog::level::info);
}

TEST_CASE("Logger::init creates a stderr logger", "[core][logger]") {
    Logger::init("clawguard-test", "warn");

    auto logger = Logger::get();
    REQUIRE(logger);
    CHECK(logger->name() == "clawguard-test");
    CHECK(logger->level() == spdlog::level::warn);

    // A second init reuses the registered logger.
    Logger::init("clawguard-test", "debug");
    CHECK(Logger::get().get() == logger.get());
    CHECK(Logger::get()->level() == spdlog::level::debug);
}

TEST_CASE("LOG macros write through the process logger", "[core][logger]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto previous = Logger::get();
    Logger::get() = std::make_shared<spdlog::logger>("capture", sink);
    Logger::get()->set_pattern("%l %v");
    Logger::set_level("info");

    LOG_DEBUG("hidden {}", 1);
    LOG_WARN("visible {}", 2);
    Logger::flush();

    CHECK(out.str() == "warning visible 2\n");
    Logger::get() = previous;
}
