#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <map>

#include <boost/asio.hpp>

#include "clawguard/net/dns_guard.hpp"

using namespace clawguard::net;
using namespace std::chrono_literals;

// Helper to run a coroutine synchronously in tests.
template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    T result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(coro);
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

namespace {

/// Answers from a fixed table; unknown hosts fail like NXDOMAIN.
class FakeResolver : public HostResolver {
public:
    std::map<std::string, std::vector<std::string>> answers;
    std::chrono::milliseconds delay{0};
    int calls = 0;

    auto resolve(std::string host)
        -> boost::asio::awaitable<clawguard::Result<std::vector<std::string>>> override
    {
        ++calls;
        if (delay > 0ms) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, delay);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
        auto it = answers.find(host);
        if (it == answers.end()) {
            co_return clawguard::make_fail(clawguard::make_error(
                clawguard::ErrorCode::ConnectionFailed, "DNS lookup failed",
                host + ": Host not found"));
        }
        co_return it->second;
    }
};

} // namespace

TEST_CASE("DnsGuard skips literal IP hosts", "[net][dns_guard]") {
    auto resolver = std::make_shared<FakeResolver>();
    DnsGuard guard(resolver);

    auto result = run_sync(guard.validate("10.0.0.1"));
    CHECK(result.valid);
    CHECK_FALSE(result.resolved_ip.has_value());
    CHECK(resolver->calls == 0);

    CHECK(run_sync(guard.validate("::1")).valid);
}

TEST_CASE("DnsGuard rejects domains resolving to private addresses", "[net][dns_guard]") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->answers["evil.example.com"] = {"10.0.0.5"};
    resolver->answers["localhost.attacker.com"] = {"127.0.0.1"};
    resolver->answers["v6.attacker.com"] = {"fc00::1234"};
    DnsGuard guard(resolver);

    SECTION("private IPv4") {
        auto result = run_sync(guard.validate("evil.example.com"));
        CHECK_FALSE(result.valid);
        CHECK(result.resolved_ip == "10.0.0.5");
        REQUIRE(result.error.has_value());
        CHECK(result.error->find("DNS rebinding protection") != std::string::npos);
    }

    SECTION("loopback") {
        auto result = run_sync(guard.validate("localhost.attacker.com"));
        CHECK_FALSE(result.valid);
        CHECK(result.error->find("127.0.0.1") != std::string::npos);
    }

    SECTION("unique local IPv6") {
        auto result = run_sync(guard.validate("v6.attacker.com"));
        CHECK_FALSE(result.valid);
        CHECK(result.resolved_ip == "fc00::1234");
    }

    SECTION("allowed when private targets are permitted") {
        auto result = run_sync(guard.validate("evil.example.com", {.allow_private_ips = true}));
        CHECK(result.valid);
        CHECK(result.resolved_ip == "10.0.0.5");
    }
}

TEST_CASE("DnsGuard checks every answer", "[net][dns_guard]") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->answers["split.example.com"] = {"93.184.216.34", "192.168.1.1"};
    resolver->answers["public.example.com"] = {"104.16.249.249", "2606:4700::6810:f9f9"};
    DnsGuard guard(resolver);

    SECTION("one private answer rejects the host") {
        auto result = run_sync(guard.validate("split.example.com"));
        CHECK_FALSE(result.valid);
        CHECK(result.resolved_ip == "192.168.1.1");
        CHECK(result.addresses.size() == 2);
    }

    SECTION("all public answers pass and report the first") {
        auto result = run_sync(guard.validate("public.example.com"));
        CHECK(result.valid);
        CHECK(result.resolved_ip == "104.16.249.249");
        CHECK_FALSE(result.error.has_value());
    }
}

TEST_CASE("DnsGuard fails closed", "[net][dns_guard]") {
    auto resolver = std::make_shared<FakeResolver>();

    SECTION("resolver error") {
        DnsGuard guard(resolver);
        auto result = run_sync(guard.validate("nonexistent.domain.xyz"));
        CHECK_FALSE(result.valid);
        CHECK_FALSE(result.resolved_ip.has_value());
        CHECK(result.error->find("DNS resolution failed") != std::string::npos);
    }

    SECTION("empty answer") {
        resolver->answers["empty.example.com"] = {};
        DnsGuard guard(resolver);
        auto result = run_sync(guard.validate("empty.example.com"));
        CHECK_FALSE(result.valid);
        CHECK(result.error->find("DNS resolution failed") != std::string::npos);
    }

    SECTION("slow lookup times out") {
        resolver->answers["slow.domain.com"] = {"1.1.1.1"};
        resolver->delay = 300ms;
        DnsGuard guard(resolver, 50ms);
        CHECK(guard.lookup_timeout() == 50ms);

        auto start = std::chrono::steady_clock::now();
        boost::asio::io_context ioc;
        DnsValidationResult result;
        std::chrono::steady_clock::duration decided_after{};
        boost::asio::co_spawn(ioc,
            [&]() -> boost::asio::awaitable<void> {
                result = co_await guard.validate("slow.domain.com");
                decided_after = std::chrono::steady_clock::now() - start;
            },
            boost::asio::detached);
        ioc.run();

        CHECK_FALSE(result.valid);
        CHECK(result.error->find("DNS resolution failed") != std::string::npos);
        CHECK(result.error->find("timed out") != std::string::npos);
        CHECK(decided_after < 300ms);
    }
}

TEST_CASE("DNS lookup timeout default", "[net][dns_guard]") {
    DnsGuard guard(std::make_shared<FakeResolver>());
    CHECK(guard.lookup_timeout() == kDnsLookupTimeout);
    CHECK(kDnsLookupTimeout == 5000ms);
}
