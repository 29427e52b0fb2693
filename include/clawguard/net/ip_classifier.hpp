#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include <boost/asio/ip/address.hpp>

namespace clawguard::net {

enum class AddressFamily { V4, V6 };

/// One entry of the private/internal range table.
struct PrivateRange {
    std::string_view label;
    AddressFamily family;
    std::array<uint8_t, 16> prefix;
    unsigned prefix_len;
};

/// The ordered table consulted for every private-address decision, both for
/// literal hosts in URLs and for DNS answers. IPv4-mapped IPv6 addresses are
/// unwrapped and matched against the IPv4 entries.
[[nodiscard]] auto private_ranges() -> std::span<const PrivateRange>;

/// Parses `text` as an IPv4/IPv6 literal. Accepts IPv6 with or without the
/// URL brackets; zone IDs are rejected.
[[nodiscard]] auto parse_ip_literal(std::string_view text)
    -> std::optional<boost::asio::ip::address>;

[[nodiscard]] auto is_ip_literal(std::string_view text) -> bool;

/// Returns the label of the first range containing `addr`, if any.
[[nodiscard]] auto match_private_range(const boost::asio::ip::address& addr)
    -> std::optional<std::string_view>;

[[nodiscard]] auto is_private_address(const boost::asio::ip::address& addr) -> bool;

/// Checks if an IP address string is in a private/reserved range.
/// Unparsable input is treated as private.
[[nodiscard]] auto is_private_ip(std::string_view ip) -> bool;

} // namespace clawguard::net
