#include "clawguard/net/url_validator.hpp"

#include "clawguard/core/utils.hpp"
#include "clawguard/net/ip_classifier.hpp"
#include "clawguard/net/url.hpp"

#include <array>

namespace clawguard::net {

namespace {

auto join_warnings(const std::vector<std::string>& warnings) -> std::string {
    std::string out;
    for (const auto& w : warnings) {
        if (!out.empty()) out += ", ";
        out += w;
    }
    return out.empty() ? "hostname flagged as internal" : out;
}

} // anonymous namespace

auto validate_url_ssrf(std::string_view url,
                       const DomainClassifier& classifier,
                       SsrfOptions options) -> ValidationResult
{
    auto trimmed = utils::trim(url);
    if (trimmed.empty()) {
        return ValidationResult::fail("URL is required");
    }

    static constexpr std::array<std::string_view, 3> blocked_schemes = {
        "data:", "file:", "javascript:",
    };
    for (auto scheme : blocked_schemes) {
        if (utils::starts_with_icase(trimmed, scheme)) {
            return ValidationResult::fail(std::string(scheme) + " URLs are not allowed");
        }
    }

    auto parsed = parse_url(trimmed);
    if (!parsed) {
        return ValidationResult::fail("Invalid URL format");
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return ValidationResult::fail("Unsupported URL scheme: " + parsed->scheme);
    }

    const auto& host = parsed->host;
    if (auto addr = parse_ip_literal(host)) {
        if (!options.allow_private_ips && is_private_address(*addr)) {
            return ValidationResult::fail("Private IP access not allowed: " + host);
        }
        return ValidationResult::ok();
    }

    auto verdict = classifier.classify(host);
    if (!options.allow_private_ips && (verdict.is_ssrf_vector || verdict.is_internal)) {
        return ValidationResult::fail("SSRF vector detected: " + join_warnings(verdict.warnings));
    }

    return ValidationResult::ok();
}

auto validate_url_ssrf(std::string_view url, SsrfOptions options) -> ValidationResult {
    static const HeuristicDomainClassifier classifier;
    return validate_url_ssrf(url, classifier, options);
}

} // namespace clawguard::net
