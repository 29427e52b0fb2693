#include "clawguard/net/header_sanitizer.hpp"

#include "clawguard/core/redact.hpp"
#include "clawguard/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace clawguard::net {

auto is_valid_header_name(std::string_view name) -> bool {
    if (name.empty()) return false;
    return std::ranges::all_of(name, [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

auto validate_and_sanitize_headers(const HeaderMap& headers) -> HeaderValidationResult {
    HeaderValidationResult result;

    for (const auto& [name, value] : headers) {
        if (!is_valid_header_name(name)) {
            return {false, "Invalid header name: " + sanitize_for_log(name, 256), {}, {}};
        }
        if (value.find_first_of("\r\n") != std::string::npos) {
            return {false, "Header injection detected in " + name, {}, {}};
        }

        result.sanitized.emplace(name, value);
        result.loggable.emplace(name, sanitize_for_log(value, kMaxHeaderValueLogLength));
    }

    return result;
}

auto find_header(const HeaderMap& headers, std::string_view name)
    -> std::optional<std::string>
{
    for (const auto& [key, value] : headers) {
        if (utils::iequals(key, name)) return value;
    }
    return std::nullopt;
}

void erase_header(HeaderMap& headers, std::string_view name) {
    std::erase_if(headers, [name](const auto& entry) {
        return utils::iequals(entry.first, name);
    });
}

} // namespace clawguard::net
