#include <catch2/catch_test_macros.hpp>

#include "clawguard/net/response_governor.hpp"

using namespace clawguard::net;

namespace {

auto response_with(std::string body, std::optional<std::string> content_length = std::nullopt)
    -> TransportResponse {
    TransportResponse r;
    r.status = 200;
    r.body = std::move(body);
    if (content_length) r.headers["Content-Length"] = *content_length;
    return r;
}

} // namespace

TEST_CASE("validate_response_size boundaries", "[net][response_governor]") {
    constexpr size_t max = 1024;

    SECTION("declared length exactly at the limit passes") {
        CHECK(validate_response_size(response_with(std::string(max, 'x'), "1024"), max));
    }

    SECTION("declared length one over the limit fails") {
        CHECK_FALSE(validate_response_size(response_with("", "1025"), max));
    }

    SECTION("actual body over the limit fails without a header") {
        CHECK_FALSE(validate_response_size(response_with(std::string(max + 1, 'x')), max));
        CHECK(validate_response_size(response_with(std::string(max, 'x')), max));
    }

    SECTION("understated Content-Length is caught by the body size") {
        CHECK_FALSE(validate_response_size(response_with(std::string(max + 1, 'x'), "10"), max));
    }
}

TEST_CASE("declared_content_length parsing", "[net][response_governor]") {
    CHECK_FALSE(declared_content_length(response_with("")).has_value());
    CHECK(declared_content_length(response_with("", " 42 ")) == 42u);
    CHECK_FALSE(declared_content_length(response_with("", "abc")).has_value());

    SECTION("header lookup is case-insensitive") {
        TransportResponse r;
        r.headers["content-length"] = "7";
        CHECK(declared_content_length(r) == 7u);
    }

    SECTION("overflowing value counts as too large") {
        auto r = response_with("", "99999999999999999999999999");
        CHECK_FALSE(validate_response_size(r, kMaxResponseSize));
    }
}

TEST_CASE("default limit is MAX_RESPONSE_SIZE", "[net][response_governor]") {
    CHECK(kMaxResponseSize == 10u * 1024 * 1024);
    CHECK(validate_response_size(response_with("ok", std::to_string(kMaxResponseSize))));
    CHECK_FALSE(validate_response_size(response_with("ok", std::to_string(kMaxResponseSize + 1))));
}
