#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "clawguard/core/correlation.hpp"

namespace correlation = clawguard::correlation;

TEST_CASE("generate_id has the cg_ prefix and is valid", "[correlation]") {
    auto id = correlation::generate_id();
    CHECK(id.starts_with("cg_"));
    CHECK(id.size() == 35);
    CHECK(correlation::is_valid_id(id));
    CHECK(id != correlation::generate_id());
}

TEST_CASE("is_valid_id enforces length and alphabet", "[correlation]") {
    CHECK(correlation::is_valid_id("abcd1234"));
    CHECK(correlation::is_valid_id("req_2026-10-18_xyz"));
    CHECK_FALSE(correlation::is_valid_id("short"));
    CHECK_FALSE(correlation::is_valid_id(std::string(65, 'a')));
    CHECK_FALSE(correlation::is_valid_id("bad id with spaces"));
    CHECK_FALSE(correlation::is_valid_id("inject\r\nX-Evil: 1"));
}

TEST_CASE("sanitize_id replaces invalid ids", "[correlation]") {
    CHECK(correlation::sanitize_id("abcd1234") == "abcd1234");
    auto replaced = correlation::sanitize_id("no");
    CHECK(replaced.starts_with("cg_"));
}

TEST_CASE("ambient correlation id", "[correlation]") {
    correlation::clear_current_id();
    CHECK_FALSE(correlation::current_id().has_value());

    SECTION("set and clear") {
        auto stored = correlation::set_current_id("trace-0001");
        CHECK(stored == "trace-0001");
        CHECK(correlation::current_id() == "trace-0001");
        correlation::clear_current_id();
        CHECK_FALSE(correlation::current_id().has_value());
    }

    SECTION("scoped id restores the previous one") {
        correlation::set_current_id("outer-0001");
        {
            correlation::ScopedCorrelationId scoped("inner-0001");
            CHECK(scoped.id() == "inner-0001");
            CHECK(correlation::current_id() == "inner-0001");
        }
        CHECK(correlation::current_id() == "outer-0001");
        correlation::clear_current_id();
    }

    SECTION("init_from_env adopts a valid value") {
        ::setenv("CLAWGUARD_CORRELATION_ID", "from-env-0001", 1);
        CHECK(correlation::init_from_env() == "from-env-0001");
        ::unsetenv("CLAWGUARD_CORRELATION_ID");
        correlation::clear_current_id();
    }

    SECTION("init_from_env generates when unset") {
        ::unsetenv("CLAWGUARD_CORRELATION_ID");
        auto id = correlation::init_from_env();
        CHECK(id.starts_with("cg_"));
        CHECK(correlation::current_id() == id);
        correlation::clear_current_id();
    }
}
