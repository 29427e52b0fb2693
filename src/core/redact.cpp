#include "clawguard/core/redact.hpp"

#include <algorithm>
#include <regex>
#include <utility>

namespace clawguard {

namespace {

auto is_log_injection_char(unsigned char c) -> bool {
    // \x1b is left alone here; it is removed together with its ANSI sequence.
    if (c == '\n' || c == '\r' || c == '\t' || c == 0x1b) return false;
    return c < 0x20 || c == 0x7f;
}

} // anonymous namespace

auto mask_sensitive_data(std::string_view text) -> std::string {
    static const std::pair<std::regex, const char*> patterns[] = {
        {std::regex(R"re(\b[a-zA-Z_]*token[=:]\s*['"]?([a-zA-Z0-9_\-]{8,})['"]?)re", std::regex::icase),
         "token=[REDACTED]"},
        {std::regex(R"re(\b[a-zA-Z_]*api[_\-]?key[=:]\s*['"]?([a-zA-Z0-9_\-]{8,})['"]?)re", std::regex::icase),
         "api_key=[REDACTED]"},
        {std::regex(R"re(\b[a-zA-Z_]*password[=:]\s*['"]?([^'"\s&]+)['"]?)re", std::regex::icase),
         "password=[REDACTED]"},
        {std::regex(R"re(\b[a-zA-Z_]*secret[=:]\s*['"]?([a-zA-Z0-9_\-]{8,})['"]?)re", std::regex::icase),
         "secret=[REDACTED]"},
        {std::regex(R"re(\bBearer\s+[a-zA-Z0-9_\-\.]+)re", std::regex::icase),
         "Bearer [REDACTED]"},
        {std::regex(R"re(\bBasic\s+[a-zA-Z0-9=+/]+)re", std::regex::icase),
         "Basic [REDACTED]"},
        {std::regex(R"re(://[^/@\s:]+:[^/@\s]+@)re"),
         "://[REDACTED]@"},
    };

    std::string result(text);
    for (const auto& [pattern, replacement] : patterns) {
        result = std::regex_replace(result, pattern, replacement);
    }
    return result;
}

auto sanitize_for_log(std::string_view text, size_t max_length) -> std::string {
    static const std::regex ansi_escape(R"(\x1b\[[0-9;]*m)");

    auto capped = text.substr(0, std::min({text.size(), max_length, kMaxSafeLogLength}));

    std::string result;
    result.reserve(capped.size());
    for (char ch : capped) {
        auto c = static_cast<unsigned char>(ch);
        if (is_log_injection_char(c)) continue;
        if (c == '\r' || c == '\n') {
            result += "\\n";
            continue;
        }
        result += ch;
    }

    return std::regex_replace(result, ansi_escape, "");
}

auto secure_log_string(std::string_view text, size_t max_length) -> std::string {
    return mask_sensitive_data(sanitize_for_log(text, max_length));
}

} // namespace clawguard
