#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <spdlog/logger.h>

#include "clawguard/core/types.hpp"

namespace clawguard::net {

enum class AuditSeverity {
    Debug,
    Info,
    Warning,
    Error,
    Critical,
};

auto audit_severity_to_string(AuditSeverity severity) -> std::string_view;

namespace audit_event {
inline constexpr std::string_view kSecurityViolation = "SECURITY_VIOLATION";
inline constexpr std::string_view kExternalCall = "EXTERNAL_CALL";
} // namespace audit_event

namespace violation {
inline constexpr std::string_view kSsrfAttempt = "SSRF_ATTEMPT";
inline constexpr std::string_view kDnsRebindingAttempt = "DNS_REBINDING_ATTEMPT";
inline constexpr std::string_view kHeaderInjection = "HEADER_INJECTION";
inline constexpr std::string_view kOversizedResponse = "OVERSIZED_RESPONSE";
} // namespace violation

struct AuditEvent {
    std::string event_type;
    AuditSeverity severity = AuditSeverity::Info;
    json details = json::object();
    std::string timestamp;                      // ISO-8601 UTC
    std::optional<std::string> correlation_id;

    [[nodiscard]] auto to_json() const -> json;
};

/// Destination for audit events. record() may throw; the emitter contains it.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual auto record(AuditEvent event) -> boost::asio::awaitable<void> = 0;
};

/// Writes each event as one JSON line to a dedicated spdlog logger.
class LogAuditSink : public AuditSink {
public:
    explicit LogAuditSink(std::shared_ptr<spdlog::logger> logger);

    /// File-backed sink when `path` is set, stderr otherwise.
    static auto create(const std::optional<std::string>& path) -> std::shared_ptr<LogAuditSink>;

    auto record(AuditEvent event) -> boost::asio::awaitable<void> override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// Builds security and call-outcome events and hands them to the sink.
/// URLs are masked before they leave the process. A failing sink is logged
/// and never turns into a request failure.
class AuditEmitter {
public:
    explicit AuditEmitter(std::shared_ptr<AuditSink> sink);

    auto ssrf_attempt(std::string_view url, std::string_view reason,
                      std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    auto dns_rebinding_attempt(std::string_view url, std::string_view hostname,
                               std::string_view reason,
                               std::optional<std::string> resolved_ip,
                               std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    auto header_injection(std::string_view url, std::string_view reason,
                          std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    auto oversized_response(std::string_view url, int status,
                            std::optional<std::string> content_length,
                            std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    auto call_succeeded(std::string_view url, std::string_view method, int status,
                        int64_t duration_ms, std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    auto call_failed(std::string_view url, std::string_view method, std::string_view error_code,
                     int64_t duration_ms, std::optional<std::string> correlation_id)
        -> boost::asio::awaitable<void>;

    [[nodiscard]] auto has_sink() const noexcept -> bool { return sink_ != nullptr; }

private:
    auto emit(AuditEvent event) -> boost::asio::awaitable<void>;

    std::shared_ptr<AuditSink> sink_;
};

} // namespace clawguard::net
