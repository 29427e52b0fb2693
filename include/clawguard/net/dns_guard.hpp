#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "clawguard/core/error.hpp"
#include "clawguard/net/constants.hpp"

namespace clawguard::net {

/// Name resolution seam. Implementations must tolerate concurrent calls.
class HostResolver {
public:
    virtual ~HostResolver() = default;

    /// Resolves `host` to textual addresses (IPv4 and IPv6).
    virtual auto resolve(std::string host)
        -> boost::asio::awaitable<Result<std::vector<std::string>>> = 0;
};

/// System resolver (getaddrinfo) through boost::asio::ip::tcp::resolver.
class AsioHostResolver : public HostResolver {
public:
    auto resolve(std::string host)
        -> boost::asio::awaitable<Result<std::vector<std::string>>> override;
};

struct DnsValidationResult {
    bool valid = true;
    std::optional<std::string> error;
    /// Set whenever a lookup completed: the offending address on rejection,
    /// the first answer otherwise.
    std::optional<std::string> resolved_ip;
    /// Every answer, in the order they were checked.
    std::vector<std::string> addresses;

    explicit operator bool() const noexcept { return valid; }
};

struct DnsOptions {
    bool allow_private_ips = false;
};

/// Re-validates a domain at resolution time. A name that is public when the
/// URL is checked can answer with a private address when the connection is
/// made; only the resolved answers close that gap.
///
/// The lookup is raced against a timer; a timeout or resolver error fails
/// closed. Every answer is checked and any private one rejects the host.
class DnsGuard {
public:
    explicit DnsGuard(std::shared_ptr<HostResolver> resolver,
                      std::chrono::milliseconds lookup_timeout = kDnsLookupTimeout);

    auto validate(std::string_view hostname, DnsOptions options = {})
        -> boost::asio::awaitable<DnsValidationResult>;

    [[nodiscard]] auto lookup_timeout() const noexcept -> std::chrono::milliseconds {
        return lookup_timeout_;
    }

private:
    auto lookup(std::string host)
        -> boost::asio::awaitable<std::optional<Result<std::vector<std::string>>>>;

    std::shared_ptr<HostResolver> resolver_;
    std::chrono::milliseconds lookup_timeout_;
};

} // namespace clawguard::net
