#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "clawguard/core/types.hpp"
#include "clawguard/net/constants.hpp"

namespace clawguard::net {

struct HeaderValidationResult {
    bool valid = true;
    std::optional<std::string> error;
    /// Headers to transmit, values unchanged.
    HeaderMap sanitized;
    /// Log-safe copies (sanitize_for_log, capped at kMaxHeaderValueLogLength)
    /// for diagnostics and audit; never sent.
    HeaderMap loggable;

    explicit operator bool() const noexcept { return valid; }
};

/// Header names must be one or more of [A-Za-z0-9_-].
[[nodiscard]] auto is_valid_header_name(std::string_view name) -> bool;

/// Rejects invalid header names and any value containing CR or LF, which
/// would let a caller inject extra headers or split the request.
auto validate_and_sanitize_headers(const HeaderMap& headers) -> HeaderValidationResult;

/// Case-insensitive header lookup.
auto find_header(const HeaderMap& headers, std::string_view name)
    -> std::optional<std::string>;

/// Removes every header whose name matches `name` case-insensitively.
void erase_header(HeaderMap& headers, std::string_view name);

} // namespace clawguard::net
