#include "clawguard/net/ip_classifier.hpp"

#include "clawguard/core/logger.hpp"

#include <string>

namespace clawguard::net {

namespace ip = boost::asio::ip;

namespace {

constexpr auto v4(std::string_view label, uint8_t a, uint8_t b, unsigned len) -> PrivateRange {
    return PrivateRange{label, AddressFamily::V4, {a, b}, len};
}

constexpr auto v6(std::string_view label, uint8_t a, uint8_t b, unsigned len) -> PrivateRange {
    return PrivateRange{label, AddressFamily::V6, {a, b}, len};
}

constexpr std::array kRanges = {
    v4("ipv4-current-network", 0, 0, 8),       // 0.0.0.0/8
    v4("ipv4-private-10", 10, 0, 8),           // 10.0.0.0/8
    v4("ipv4-cgnat", 100, 64, 10),             // 100.64.0.0/10
    v4("ipv4-loopback", 127, 0, 8),            // 127.0.0.0/8
    v4("ipv4-link-local", 169, 254, 16),       // 169.254.0.0/16
    v4("ipv4-private-172", 172, 16, 12),       // 172.16.0.0/12
    v4("ipv4-private-192", 192, 168, 16),      // 192.168.0.0/16
    v6("ipv6-unspecified", 0, 0, 128),         // ::
    PrivateRange{"ipv6-loopback", AddressFamily::V6,
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}, 128},  // ::1
    v6("ipv6-unique-local", 0xfc, 0, 7),       // fc00::/7
    v6("ipv6-link-local", 0xfe, 0x80, 10),     // fe80::/10
    v6("ipv6-multicast", 0xff, 0, 8),          // ff00::/8
};

template <size_t N>
auto prefix_matches(const std::array<uint8_t, N>& bytes, const PrivateRange& range) -> bool {
    unsigned full = range.prefix_len / 8;
    unsigned rest = range.prefix_len % 8;
    for (unsigned i = 0; i < full; ++i) {
        if (bytes[i] != range.prefix[i]) return false;
    }
    if (rest == 0) return true;
    auto mask = static_cast<uint8_t>(0xFF << (8 - rest));
    return (bytes[full] & mask) == (range.prefix[full] & mask);
}

auto match_v4(const ip::address_v4& addr) -> std::optional<std::string_view> {
    auto bytes = addr.to_bytes();
    for (const auto& range : kRanges) {
        if (range.family == AddressFamily::V4 && prefix_matches(bytes, range)) {
            return range.label;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

auto private_ranges() -> std::span<const PrivateRange> {
    return kRanges;
}

auto parse_ip_literal(std::string_view text) -> std::optional<ip::address> {
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
    }
    if (text.empty() || text.find('%') != std::string_view::npos) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    auto addr = ip::make_address(std::string(text), ec);
    if (ec) return std::nullopt;
    return addr;
}

auto is_ip_literal(std::string_view text) -> bool {
    return parse_ip_literal(text).has_value();
}

auto match_private_range(const ip::address& addr) -> std::optional<std::string_view> {
    if (addr.is_v4()) {
        return match_v4(addr.to_v4());
    }

    auto v6addr = addr.to_v6();
    if (v6addr.is_v4_mapped()) {
        return match_v4(ip::make_address_v4(ip::v4_mapped, v6addr));
    }

    auto bytes = v6addr.to_bytes();
    for (const auto& range : kRanges) {
        if (range.family == AddressFamily::V6 && prefix_matches(bytes, range)) {
            return range.label;
        }
    }
    return std::nullopt;
}

auto is_private_address(const ip::address& addr) -> bool {
    return match_private_range(addr).has_value();
}

auto is_private_ip(std::string_view ip_text) -> bool {
    auto addr = parse_ip_literal(ip_text);
    if (!addr) {
        // Can't parse -> conservative: block it
        LOG_DEBUG("is_private_ip: cannot parse '{}' as an address", ip_text);
        return true;
    }
    return is_private_address(*addr);
}

} // namespace clawguard::net
