#include "clawguard/net/audit.hpp"

#include "clawguard/core/logger.hpp"
#include "clawguard/core/redact.hpp"
#include "clawguard/core/utils.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace clawguard::net {

namespace {

constexpr const char* kAuditLoggerName = "clawguard.audit";

auto masked(std::string_view url) -> std::string {
    return secure_log_string(url, kMaxSafeLogLength);
}

auto make_event(std::string_view type, AuditSeverity severity, json details,
                std::optional<std::string> correlation_id) -> AuditEvent {
    AuditEvent event;
    event.event_type = std::string(type);
    event.severity = severity;
    event.details = std::move(details);
    event.timestamp = utils::timestamp_iso();
    event.correlation_id = std::move(correlation_id);
    return event;
}

} // anonymous namespace

auto audit_severity_to_string(AuditSeverity severity) -> std::string_view {
    switch (severity) {
        case AuditSeverity::Debug: return "debug";
        case AuditSeverity::Info: return "info";
        case AuditSeverity::Warning: return "warning";
        case AuditSeverity::Error: return "error";
        case AuditSeverity::Critical: return "critical";
        default: return "info";
    }
}

auto AuditEvent::to_json() const -> json {
    json j = {
        {"eventType", event_type},
        {"severity", std::string(audit_severity_to_string(severity))},
        {"details", details},
        {"timestamp", timestamp},
    };
    if (correlation_id) {
        j["correlationId"] = *correlation_id;
    }
    return j;
}

// ---------------------------------------------------------------------------
// LogAuditSink
// ---------------------------------------------------------------------------

LogAuditSink::LogAuditSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

auto LogAuditSink::create(const std::optional<std::string>& path)
    -> std::shared_ptr<LogAuditSink>
{
    if (auto existing = spdlog::get(kAuditLoggerName)) {
        return std::make_shared<LogAuditSink>(existing);
    }

    std::shared_ptr<spdlog::logger> logger;
    if (path) {
        logger = spdlog::basic_logger_mt(kAuditLoggerName, *path);
    } else {
        logger = spdlog::stderr_logger_mt(kAuditLoggerName);
    }
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);
    return std::make_shared<LogAuditSink>(std::move(logger));
}

auto LogAuditSink::record(AuditEvent event) -> boost::asio::awaitable<void> {
    logger_->info(event.to_json().dump());
    co_return;
}

// ---------------------------------------------------------------------------
// AuditEmitter
// ---------------------------------------------------------------------------

AuditEmitter::AuditEmitter(std::shared_ptr<AuditSink> sink)
    : sink_(std::move(sink)) {}

auto AuditEmitter::emit(AuditEvent event) -> boost::asio::awaitable<void> {
    if (!sink_) co_return;

    auto type = event.event_type;
    try {
        co_await sink_->record(std::move(event));
    } catch (const std::exception& e) {
        LOG_ERROR("Audit sink failed to record {}: {}", type, e.what());
    } catch (...) {
        LOG_ERROR("Audit sink failed to record {}: unknown exception", type);
    }
}

auto AuditEmitter::ssrf_attempt(std::string_view url, std::string_view reason,
                                std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"violationType", std::string(violation::kSsrfAttempt)},
        {"url", masked(url)},
        {"reason", std::string(reason)},
    };
    co_await emit(make_event(audit_event::kSecurityViolation, AuditSeverity::Warning,
                             std::move(details), std::move(correlation_id)));
}

auto AuditEmitter::dns_rebinding_attempt(std::string_view url, std::string_view hostname,
                                         std::string_view reason,
                                         std::optional<std::string> resolved_ip,
                                         std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"violationType", std::string(violation::kDnsRebindingAttempt)},
        {"url", masked(url)},
        {"hostname", std::string(hostname)},
        {"reason", std::string(reason)},
    };
    if (resolved_ip) {
        details["resolvedIP"] = *resolved_ip;
    }
    co_await emit(make_event(audit_event::kSecurityViolation, AuditSeverity::Critical,
                             std::move(details), std::move(correlation_id)));
}

auto AuditEmitter::header_injection(std::string_view url, std::string_view reason,
                                    std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"violationType", std::string(violation::kHeaderInjection)},
        {"url", masked(url)},
        {"reason", sanitize_for_log(reason)},
    };
    co_await emit(make_event(audit_event::kSecurityViolation, AuditSeverity::Warning,
                             std::move(details), std::move(correlation_id)));
}

auto AuditEmitter::oversized_response(std::string_view url, int status,
                                      std::optional<std::string> content_length,
                                      std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"violationType", std::string(violation::kOversizedResponse)},
        {"url", masked(url)},
        {"status", status},
    };
    if (content_length) {
        details["contentLength"] = *content_length;
    }
    co_await emit(make_event(audit_event::kSecurityViolation, AuditSeverity::Warning,
                             std::move(details), std::move(correlation_id)));
}

auto AuditEmitter::call_succeeded(std::string_view url, std::string_view method, int status,
                                  int64_t duration_ms, std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"url", masked(url)},
        {"method", utils::to_upper(method)},
        {"status", status},
        {"duration", duration_ms},
    };
    co_await emit(make_event(audit_event::kExternalCall, AuditSeverity::Debug,
                             std::move(details), std::move(correlation_id)));
}

auto AuditEmitter::call_failed(std::string_view url, std::string_view method,
                               std::string_view error_code, int64_t duration_ms,
                               std::optional<std::string> correlation_id)
    -> boost::asio::awaitable<void>
{
    json details = {
        {"url", masked(url)},
        {"method", utils::to_upper(method)},
        {"error", std::string(error_code)},
        {"duration", duration_ms},
    };
    co_await emit(make_event(audit_event::kExternalCall, AuditSeverity::Warning,
                             std::move(details), std::move(correlation_id)));
}

} // namespace clawguard::net
