#include "clawguard/net/url.hpp"

#include "clawguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace clawguard::net {

namespace {

auto is_scheme_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

auto default_port(std::string_view scheme) -> uint16_t {
    return scheme == "https" ? 443 : 80;
}

/// Parses one WHATWG IPv4 part: decimal, 0x-hex or leading-zero octal.
auto parse_ipv4_part(std::string_view part) -> std::optional<uint64_t> {
    if (part.empty()) return std::nullopt;
    int base = 10;
    if (part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
        base = 16;
        part.remove_prefix(2);
        if (part.empty()) return 0;
    } else if (part.size() >= 2 && part[0] == '0') {
        base = 8;
        part.remove_prefix(1);
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, base);
    if (ec != std::errc{} || ptr != part.data() + part.size()) return std::nullopt;
    return value;
}

auto ends_in_number(std::string_view host) -> bool {
    auto parts = utils::split(host, '.');
    if (!parts.empty() && parts.back().empty()) parts.pop_back();
    if (parts.empty()) return false;
    const auto& last = parts.back();
    if (!last.empty() && std::ranges::all_of(last, [](unsigned char c) { return std::isdigit(c); })) {
        return true;
    }
    return parse_ipv4_part(last).has_value();
}

/// Returns the dotted-quad form of a numeric host, an error for a malformed
/// numeric host, and nullopt for an ordinary domain name.
auto normalize_ipv4_host(std::string_view host) -> Result<std::optional<std::string>> {
    if (!ends_in_number(host)) return std::optional<std::string>{};

    auto parts = utils::split(host, '.');
    if (!parts.empty() && parts.back().empty()) parts.pop_back();
    if (parts.empty() || parts.size() > 4) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Invalid IPv4 host", std::string(host)));
    }

    std::vector<uint64_t> numbers;
    for (const auto& part : parts) {
        auto n = parse_ipv4_part(part);
        if (!n) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Invalid IPv4 host", std::string(host)));
        }
        numbers.push_back(*n);
    }

    for (size_t i = 0; i + 1 < numbers.size(); ++i) {
        if (numbers[i] > 255) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Invalid IPv4 host", std::string(host)));
        }
    }
    auto remaining_bytes = 5 - numbers.size();
    if (numbers.back() >= (uint64_t{1} << (8 * remaining_bytes))) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Invalid IPv4 host", std::string(host)));
    }

    uint64_t ipv4 = numbers.back();
    for (size_t i = 0; i + 1 < numbers.size(); ++i) {
        ipv4 += numbers[i] << (8 * (3 - i));
    }

    return std::optional<std::string>{
        std::to_string((ipv4 >> 24) & 0xFF) + "." + std::to_string((ipv4 >> 16) & 0xFF) + "." +
        std::to_string((ipv4 >> 8) & 0xFF) + "." + std::to_string(ipv4 & 0xFF)};
}

auto is_forbidden_host_char(unsigned char c) -> bool {
    static constexpr std::string_view forbidden = " #%/:<>?@[\\]^|";
    return c < 0x21 || c == 0x7f || forbidden.find(static_cast<char>(c)) != std::string_view::npos;
}

auto fail(std::string message, std::string_view text) -> Result<Url> {
    return std::unexpected(make_error(ErrorCode::InvalidArgument, std::move(message), std::string(text)));
}

} // anonymous namespace

auto Url::effective_port() const -> uint16_t {
    return port.value_or(default_port(scheme));
}

auto Url::authority() const -> std::string {
    std::string out = is_ipv6_host() ? "[" + host + "]" : host;
    if (port && *port != default_port(scheme)) {
        out += ":" + std::to_string(*port);
    }
    return out;
}

auto Url::origin() const -> std::string {
    return scheme + "://" + authority();
}

auto Url::to_string() const -> std::string {
    return origin() + target;
}

auto parse_url(std::string_view text) -> Result<Url> {
    auto input = utils::trim(text);
    std::string_view rest = input;

    auto colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0 ||
        !std::isalpha(static_cast<unsigned char>(rest[0])) ||
        !std::all_of(rest.begin(), rest.begin() + static_cast<std::ptrdiff_t>(colon), is_scheme_char)) {
        return fail("Invalid URL format", text);
    }

    Url url;
    url.scheme = utils::to_lower(rest.substr(0, colon));
    rest.remove_prefix(colon + 1);

    // Special schemes treat '\' like '/'.
    auto is_slash = [](char c) { return c == '/' || c == '\\'; };
    if (rest.size() < 2 || !is_slash(rest[0]) || !is_slash(rest[1])) {
        return fail("URL has no authority", text);
    }
    rest.remove_prefix(2);

    auto authority_end = rest.find_first_of("/\\?#");
    std::string_view authority = rest.substr(0, authority_end);
    std::string_view tail = authority_end == std::string_view::npos
        ? std::string_view{} : rest.substr(authority_end);

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        url.userinfo = std::string(authority.substr(0, at));
        authority.remove_prefix(at + 1);
    }

    std::string_view host_part;
    std::string_view port_part;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return fail("Unterminated IPv6 host", text);
        host_part = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return fail("Invalid characters after IPv6 host", text);
            port_part = after.substr(1);
        }
        if (host_part.empty() || host_part.find_first_not_of("0123456789abcdefABCDEF:.") != std::string_view::npos) {
            return fail("Invalid IPv6 host", text);
        }
        url.host = utils::to_lower(host_part);
    } else {
        auto port_colon = authority.rfind(':');
        host_part = authority.substr(0, port_colon);
        if (port_colon != std::string_view::npos) port_part = authority.substr(port_colon + 1);

        auto decoded = utils::to_lower(utils::url_decode(host_part));
        if (decoded.empty()) return fail("URL has an empty host", text);
        if (std::ranges::any_of(decoded, [](unsigned char c) { return is_forbidden_host_char(c); })) {
            return fail("URL host contains forbidden characters", text);
        }

        auto numeric = normalize_ipv4_host(decoded);
        if (!numeric) return std::unexpected(numeric.error());
        url.host = numeric->value_or(decoded);
    }

    if (!port_part.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), value);
        if (ec != std::errc{} || ptr != port_part.data() + port_part.size() || value > 65535) {
            return fail("Invalid port", text);
        }
        url.port = static_cast<uint16_t>(value);
    }

    auto fragment = tail.find('#');
    if (fragment != std::string_view::npos) tail = tail.substr(0, fragment);
    std::string target(tail);
    std::ranges::replace(target, '\\', '/');
    if (target.empty() || target.front() == '?') target.insert(target.begin(), '/');
    url.target = std::move(target);

    return url;
}

auto extract_hostname(std::string_view url) -> std::optional<std::string> {
    auto parsed = parse_url(url);
    if (!parsed) return std::nullopt;
    return parsed->host;
}

auto resolve_reference(const Url& base, std::string_view location) -> Result<Url> {
    auto loc = utils::trim(location);
    if (loc.empty()) return fail("Empty redirect location", location);

    // Absolute URL with its own scheme.
    auto colon = loc.find(':');
    auto first_delim = loc.find_first_of("/?#");
    if (colon != std::string::npos && (first_delim == std::string::npos || colon < first_delim)) {
        return parse_url(loc);
    }

    if (loc.starts_with("//")) {
        return parse_url(base.scheme + ":" + loc);
    }
    if (loc.front() == '/') {
        return parse_url(base.origin() + loc);
    }

    auto path = base.target.substr(0, base.target.find('?'));
    if (loc.front() == '?') {
        return parse_url(base.origin() + path + loc);
    }
    auto slash = path.rfind('/');
    auto dir = slash == std::string::npos ? std::string("/") : path.substr(0, slash + 1);
    return parse_url(base.origin() + dir + loc);
}

} // namespace clawguard::net
