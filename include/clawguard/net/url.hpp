#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "clawguard/core/error.hpp"

namespace clawguard::net {

/// A parsed absolute URL. The same parse feeds validation and dispatch so the
/// host that is checked is the host that is contacted.
struct Url {
    std::string scheme;                  // lowercased
    std::string userinfo;
    std::string host;                    // lowercased, no IPv6 brackets
    std::optional<uint16_t> port;
    std::string target = "/";            // path + query, fragment dropped

    [[nodiscard]] auto is_ipv6_host() const -> bool {
        return host.find(':') != std::string::npos;
    }

    /// Explicit port, or the scheme default (80/443).
    [[nodiscard]] auto effective_port() const -> uint16_t;

    /// Host as it appears in a URL authority: brackets for IPv6, port only
    /// when it differs from the scheme default.
    [[nodiscard]] auto authority() const -> std::string;

    /// scheme://authority
    [[nodiscard]] auto origin() const -> std::string;

    /// Serialized form without userinfo.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Parses an absolute URL with an authority component. Follows browser
/// host-parsing rules where they matter for SSRF: backslashes end the
/// authority, the last '@' separates userinfo, percent-escapes in the host
/// are decoded and numeric IPv4 forms (2130706433, 0x7f.1) are normalized
/// to dotted quads.
auto parse_url(std::string_view text) -> Result<Url>;

/// Extracts the hostname from a URL, or nullopt if it cannot be parsed.
auto extract_hostname(std::string_view url) -> std::optional<std::string>;

/// Resolves a redirect Location against the URL that produced it.
auto resolve_reference(const Url& base, std::string_view location) -> Result<Url>;

} // namespace clawguard::net
