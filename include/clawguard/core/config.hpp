#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clawguard/core/types.hpp"

// std::optional serializer for nlohmann/json, used by the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace clawguard {

/// Defaults for every client created from this config. Per-call options
/// override these; timeouts are clamped to [MIN_TIMEOUT, MAX_TIMEOUT] on use.
struct ClientConfig {
    int64_t default_timeout_ms = 10000;
    int64_t max_response_bytes = 10 * 1024 * 1024;
    int max_redirects = 5;
    int64_t dns_lookup_timeout_ms = 5000;
    std::string user_agent;           // empty = built-in USER_AGENT
    bool allow_private_ips = false;
    bool audit = false;
    bool verify_ssl = true;
    int worker_threads = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientConfig, default_timeout_ms, max_response_bytes,
    max_redirects, dns_lookup_timeout_ms, user_agent, allow_private_ips, audit, verify_ssl, worker_threads)

struct Config {
    ClientConfig client;
    std::string log_level = "info";
    std::optional<std::string> audit_log_path;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, client, log_level, audit_log_path)

auto load_config(const std::filesystem::path& path) -> Config;

/// Replaces out-of-range client limits with their defaults. A non-positive
/// size limit would otherwise disable the response size check.
void validate_config(Config& config);
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays CLAWGUARD_* environment variables onto an existing config.
void apply_env_overrides(Config& config);

} // namespace clawguard
