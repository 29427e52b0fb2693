#include "clawguard/net/domain_classifier.hpp"

#include "clawguard/core/utils.hpp"
#include "clawguard/net/ip_classifier.hpp"

#include <algorithm>
#include <regex>

namespace clawguard::net {

auto HeuristicDomainClassifier::internal_indicators() -> const std::vector<std::string>& {
    static const std::vector<std::string> indicators = {
        "internal", "intranet", "local", "localdomain", "lan", "home",
        "corp", "svc", "cluster", "docker", "container", "pod",
    };
    return indicators;
}

auto HeuristicDomainClassifier::classify(std::string_view hostname) const
    -> DomainClassification
{
    DomainClassification result;

    auto host = utils::to_lower(utils::trim(hostname));
    if (!host.empty() && host.back() == '.') host.pop_back();

    if (host.empty()) {
        result.valid = false;
        result.warnings.emplace_back("hostname is empty");
        return result;
    }

    if (host.size() > kMaxHostnameLength) {
        result.valid = false;
        result.warnings.emplace_back("hostname exceeds 253 characters");
        return result;
    }

    if (auto addr = parse_ip_literal(host)) {
        if (auto range = match_private_range(*addr)) {
            result.valid = false;
            result.is_ssrf_vector = true;
            result.warnings.push_back("private/internal IP address (" + std::string(*range) + ")");
        }
        return result;
    }

    if (host == "localhost" || host == "localhost.localdomain" || host.ends_with(".localhost")) {
        result.valid = false;
        result.is_internal = true;
        result.warnings.push_back("internal hostname: " + host);
        return result;
    }

    // A leading dotted quad is a common way to make a rebinding service or a
    // wildcard DNS zone answer with that address.
    static const std::regex leading_quad(R"(^(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})\.)");
    std::smatch m;
    if (std::regex_search(host, m, leading_quad)) {
        auto embedded = m[1].str();
        if (auto addr = parse_ip_literal(embedded); addr && is_private_address(*addr)) {
            result.is_ssrf_vector = true;
            result.warnings.push_back("hostname embeds private IP address " + embedded);
        } else {
            result.warnings.push_back("hostname contains numeric IP components");
        }
    }

    const auto& indicators = internal_indicators();
    auto labels = utils::split(host, '.');
    auto is_indicator = [&](const std::string& label) {
        return std::ranges::find(indicators, label) != indicators.end();
    };

    // Any indicator as the top-level label ("nas.lan", "api.internal"); only
    // the unambiguous ones further left ("app.internal.example.com").
    static const std::vector<std::string> strong = {
        "internal", "intranet", "localdomain", "svc", "cluster",
    };
    if (is_indicator(labels.back())) {
        result.is_internal = true;
        result.warnings.push_back("internal hostname suffix '." + labels.back() + "'");
    } else {
        for (size_t i = 0; i + 1 < labels.size(); ++i) {
            if (std::ranges::find(strong, labels[i]) != strong.end()) {
                result.is_internal = true;
                result.warnings.push_back("internal hostname label '" + labels[i] + "'");
                break;
            }
        }
    }

    if (result.is_internal || result.is_ssrf_vector) {
        result.valid = false;
    }
    return result;
}

} // namespace clawguard::net
