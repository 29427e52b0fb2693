#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include <boost/asio/io_context.hpp>

#include "clawguard/net/lifecycle.hpp"

using namespace clawguard::net;
using namespace std::chrono_literals;

TEST_CASE("clamp_timeout bounds caller timeouts", "[net][lifecycle]") {
    CHECK(clamp_timeout(10ms) == kMinTimeout);
    CHECK(clamp_timeout(0ms) == kMinTimeout);
    CHECK(clamp_timeout(-5ms) == kMinTimeout);
    CHECK(clamp_timeout(120000ms) == kMaxTimeout);
    CHECK(clamp_timeout(5000ms) == 5000ms);
    CHECK(clamp_timeout(kMinTimeout) == kMinTimeout);
    CHECK(clamp_timeout(kMaxTimeout) == kMaxTimeout);

    static_assert(clamp_timeout(std::chrono::milliseconds(1)) == kMinTimeout);
}

TEST_CASE("RequestLifecycle arms at timeout plus grace", "[net][lifecycle]") {
    boost::asio::io_context ioc;
    RequestLifecycle lifecycle(ioc.get_executor(), 2000ms);

    CHECK(lifecycle.is_armed());
    CHECK(lifecycle.deadline() == 2000ms + kTimeoutGrace);
    CHECK_FALSE(lifecycle.token()->is_cancelled());

    lifecycle.cleanup();
    ioc.run();
}

TEST_CASE("RequestLifecycle cleanup is idempotent", "[net][lifecycle]") {
    boost::asio::io_context ioc;
    RequestLifecycle lifecycle(ioc.get_executor(), 10ms, 5ms);

    lifecycle.cleanup();
    CHECK_FALSE(lifecycle.is_armed());
    lifecycle.cleanup();
    lifecycle.cleanup();
    CHECK_FALSE(lifecycle.is_armed());

    ioc.run();
    // Disarmed before the deadline: the token never fires.
    CHECK_FALSE(lifecycle.token()->is_cancelled());
}

TEST_CASE("RequestLifecycle cancels the token at the deadline", "[net][lifecycle]") {
    boost::asio::io_context ioc;
    RequestLifecycle lifecycle(ioc.get_executor(), 20ms, 10ms);
    auto token = lifecycle.token();

    auto start = std::chrono::steady_clock::now();
    ioc.run();
    auto waited = std::chrono::steady_clock::now() - start;

    CHECK(token->is_cancelled());
    CHECK(waited >= 30ms);

    // Cleanup after the deadline fired is a safe no-op.
    lifecycle.cleanup();
    lifecycle.cleanup();
    CHECK(token->is_cancelled());
}

TEST_CASE("CancellationToken", "[net][lifecycle]") {
    CancellationToken token;
    CHECK_FALSE(token.is_cancelled());
    token.cancel();
    token.cancel();
    CHECK(token.is_cancelled());
}

TEST_CASE("CancellationToken runs its hook once", "[net][lifecycle]") {
    CancellationToken token;
    int calls = 0;
    token.set_on_cancel([&calls] { ++calls; });

    token.cancel();
    token.cancel();
    CHECK(calls == 1);

    SECTION("a hook registered after cancellation runs immediately") {
        int late = 0;
        token.set_on_cancel([&late] { ++late; });
        CHECK(late == 1);
    }
}

TEST_CASE("CancellationToken skips a cleared hook", "[net][lifecycle]") {
    CancellationToken token;
    int calls = 0;
    token.set_on_cancel([&calls] { ++calls; });
    token.clear_on_cancel();

    token.cancel();
    CHECK(token.is_cancelled());
    CHECK(calls == 0);
}

TEST_CASE("RequestLifecycle deadline runs the cancel hook", "[net][lifecycle]") {
    boost::asio::io_context ioc;
    RequestLifecycle lifecycle(ioc.get_executor(), 20ms, 10ms);
    bool aborted = false;
    lifecycle.token()->set_on_cancel([&aborted] { aborted = true; });

    ioc.run();
    CHECK(aborted);
}
