#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace clawguard {

/// Upper bound applied by sanitize_for_log regardless of the requested cap.
inline constexpr size_t kMaxSafeLogLength = 10000;

/// Replaces credential-looking substrings (token=, api_key=, password=,
/// secret=, Bearer/Basic credentials, URL userinfo) with [REDACTED].
auto mask_sensitive_data(std::string_view text) -> std::string;

/// Makes a string safe to write into a single log line: truncates to
/// min(max_length, kMaxSafeLogLength), drops control characters, renders
/// CR/LF as a literal "\n" and strips ANSI colour sequences.
auto sanitize_for_log(std::string_view text, size_t max_length = 1000) -> std::string;

/// mask_sensitive_data(sanitize_for_log(text, max_length)).
auto secure_log_string(std::string_view text, size_t max_length = 1000) -> std::string;

} // namespace clawguard
