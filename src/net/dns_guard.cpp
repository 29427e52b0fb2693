#include "clawguard/net/dns_guard.hpp"

#include "clawguard/core/logger.hpp"
#include "clawguard/net/ip_classifier.hpp"

#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clawguard::net {

namespace asio = boost::asio;

// ---------------------------------------------------------------------------
// AsioHostResolver
// ---------------------------------------------------------------------------

auto AsioHostResolver::resolve(std::string host)
    -> asio::awaitable<Result<std::vector<std::string>>>
{
    auto executor = co_await asio::this_coro::executor;
    asio::ip::tcp::resolver resolver(executor);

    std::vector<std::string> addresses;
    try {
        auto results = co_await resolver.async_resolve(host, "", asio::use_awaitable);
        for (const auto& entry : results) {
            auto addr = entry.endpoint().address().to_string();
            if (std::ranges::find(addresses, addr) == addresses.end()) {
                addresses.push_back(std::move(addr));
            }
        }
    } catch (const boost::system::system_error& e) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed, "DNS lookup failed",
                       host + ": " + e.code().message()));
    }

    // IPv4 first for consistent reporting.
    std::ranges::stable_partition(addresses, [](const std::string& a) {
        return a.find(':') == std::string::npos;
    });
    co_return addresses;
}

// ---------------------------------------------------------------------------
// DnsGuard
// ---------------------------------------------------------------------------

DnsGuard::DnsGuard(std::shared_ptr<HostResolver> resolver,
                   std::chrono::milliseconds lookup_timeout)
    : resolver_(std::move(resolver)), lookup_timeout_(lookup_timeout) {}

auto DnsGuard::lookup(std::string host)
    -> asio::awaitable<std::optional<Result<std::vector<std::string>>>>
{
    // Shared with the detached lookup, which may outlive this frame on
    // timeout. Both sides touch it only on `strand`.
    struct LookupState {
        explicit LookupState(const asio::strand<asio::any_io_executor>& s) : strand(s), wake(s) {}
        asio::strand<asio::any_io_executor> strand;
        asio::steady_timer wake;
        std::optional<Result<std::vector<std::string>>> result;
    };

    auto state = std::make_shared<LookupState>(
        asio::make_strand(co_await asio::this_coro::executor));
    state->wake.expires_after(lookup_timeout_);

    asio::co_spawn(state->strand,
        [state, resolver = resolver_, host]() -> asio::awaitable<void> {
            Result<std::vector<std::string>> answer = co_await resolver->resolve(host);
            // Resumes on the strand: this coroutine runs on it.
            state->result = std::move(answer);
            // expires_at(min) both aborts a pending wait and makes a wait that
            // has not started yet complete immediately.
            state->wake.expires_at(asio::steady_timer::time_point::min());
        },
        asio::detached);

    // The waiting half is a strand coroutine too; its result comes back on
    // the caller's executor.
    co_return co_await asio::co_spawn(state->strand,
        [state]() -> asio::awaitable<std::optional<Result<std::vector<std::string>>>> {
            if (!state->result) {
                boost::system::error_code ec;
                co_await state->wake.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            }
            co_return std::move(state->result);
        },
        asio::use_awaitable);
}

auto DnsGuard::validate(std::string_view hostname, DnsOptions options)
    -> asio::awaitable<DnsValidationResult>
{
    DnsValidationResult result;

    if (is_ip_literal(hostname)) {
        co_return result;
    }

    std::string host(hostname);
    auto answer = co_await lookup(host);

    if (!answer) {
        LOG_WARN("DnsGuard: lookup for {} timed out after {}ms", host, lookup_timeout_.count());
        result.valid = false;
        result.error = "DNS resolution failed for " + host + ": lookup timed out after " +
                       std::to_string(lookup_timeout_.count()) + "ms";
        co_return result;
    }
    if (!answer->has_value()) {
        LOG_WARN("DnsGuard: lookup for {} failed: {}", host, answer->error().what());
        result.valid = false;
        result.error = "DNS resolution failed for " + host + ": " + answer->error().what();
        co_return result;
    }

    result.addresses = std::move(answer->value());
    if (result.addresses.empty()) {
        result.valid = false;
        result.error = "DNS resolution failed for " + host + ": no addresses returned";
        co_return result;
    }

    result.resolved_ip = result.addresses.front();
    if (options.allow_private_ips) {
        co_return result;
    }

    for (const auto& addr : result.addresses) {
        if (is_private_ip(addr)) {
            result.valid = false;
            result.resolved_ip = addr;
            result.error = "DNS rebinding protection: " + host +
                           " resolves to private IP " + addr;
            co_return result;
        }
    }

    co_return result;
}

} // namespace clawguard::net
