#include "clawguard/core/config.hpp"
#include "clawguard/core/logger.hpp"
#include "clawguard/core/utils.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace clawguard {

namespace {

auto parse_int(std::string_view text) -> std::optional<int64_t> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

auto parse_bool(std::string_view text) -> std::optional<bool> {
    auto v = utils::to_lower(utils::trim(text));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        validate_config(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("CLAWGUARD_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CLAWGUARD_TIMEOUT_MS")) {
        if (auto ms = parse_int(val)) {
            config.client.default_timeout_ms = *ms;
        } else {
            LOG_WARN("Ignoring CLAWGUARD_TIMEOUT_MS='{}': not an integer", val);
        }
    }
    if (auto* val = std::getenv("CLAWGUARD_MAX_RESPONSE_BYTES")) {
        if (auto bytes = parse_int(val); bytes && *bytes > 0) {
            config.client.max_response_bytes = *bytes;
        } else {
            LOG_WARN("Ignoring CLAWGUARD_MAX_RESPONSE_BYTES='{}'", val);
        }
    }
    if (auto* val = std::getenv("CLAWGUARD_AUDIT_LOG")) {
        config.audit_log_path = val;
    }
    if (auto* val = std::getenv("CLAWGUARD_ALLOW_PRIVATE_IPS")) {
        if (auto allow = parse_bool(val)) {
            config.client.allow_private_ips = *allow;
        }
    }
    validate_config(config);
}

void validate_config(Config& config) {
    const ClientConfig defaults;
    auto& client = config.client;

    if (client.max_response_bytes <= 0) {
        LOG_WARN("Invalid max_response_bytes {}, using {}",
                 client.max_response_bytes, defaults.max_response_bytes);
        client.max_response_bytes = defaults.max_response_bytes;
    }
    if (client.max_redirects < 0) {
        LOG_WARN("Invalid max_redirects {}, using {}", client.max_redirects, defaults.max_redirects);
        client.max_redirects = defaults.max_redirects;
    }
    if (client.dns_lookup_timeout_ms <= 0) {
        LOG_WARN("Invalid dns_lookup_timeout_ms {}, using {}",
                 client.dns_lookup_timeout_ms, defaults.dns_lookup_timeout_ms);
        client.dns_lookup_timeout_ms = defaults.dns_lookup_timeout_ms;
    }
    if (client.worker_threads < 1) {
        LOG_WARN("Invalid worker_threads {}, using {}", client.worker_threads, defaults.worker_threads);
        client.worker_threads = defaults.worker_threads;
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace clawguard
