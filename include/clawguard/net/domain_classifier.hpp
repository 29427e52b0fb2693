#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace clawguard::net {

/// Verdict of the naming-heuristic check run before any DNS work.
struct DomainClassification {
    bool valid = true;
    bool is_ssrf_vector = false;
    bool is_internal = false;
    std::vector<std::string> warnings;
};

/// Flags hostnames that look internal or that smuggle an address, from the
/// name alone. Implementations must be pure and thread-safe.
class DomainClassifier {
public:
    virtual ~DomainClassifier() = default;

    [[nodiscard]] virtual auto classify(std::string_view hostname) const
        -> DomainClassification = 0;
};

/// Default rule set: literal private addresses, localhost, internal
/// suffixes/labels (.local, .internal, .lan, .svc, ...) and names that start
/// with a private dotted quad such as 10.0.0.1.example.com.
class HeuristicDomainClassifier : public DomainClassifier {
public:
    static constexpr size_t kMaxHostnameLength = 253;

    [[nodiscard]] auto classify(std::string_view hostname) const
        -> DomainClassification override;

    /// Labels that mark a name as belonging to a private network.
    [[nodiscard]] static auto internal_indicators() -> const std::vector<std::string>&;
};

} // namespace clawguard::net
