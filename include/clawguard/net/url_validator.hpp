#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "clawguard/net/domain_classifier.hpp"

namespace clawguard::net {

/// Outcome of a single validation step; never carries partial success.
struct ValidationResult {
    bool valid = true;
    std::optional<std::string> error;

    static auto ok() -> ValidationResult { return {}; }
    static auto fail(std::string reason) -> ValidationResult { return {false, std::move(reason)}; }

    explicit operator bool() const noexcept { return valid; }
};

struct SsrfOptions {
    bool allow_private_ips = false;
};

/// SSRF guard for a request URL.
///
/// data:, file: and javascript: URLs are rejected regardless of
/// `allow_private_ips`. Other schemes than http/https are rejected. A literal
/// IP host is matched against the private range table; a domain host is
/// handed to `classifier`, and a flagged name is rejected unless private
/// targets are explicitly allowed.
auto validate_url_ssrf(std::string_view url,
                       const DomainClassifier& classifier,
                       SsrfOptions options = {}) -> ValidationResult;

/// Same as above with the built-in HeuristicDomainClassifier.
auto validate_url_ssrf(std::string_view url, SsrfOptions options = {}) -> ValidationResult;

} // namespace clawguard::net
