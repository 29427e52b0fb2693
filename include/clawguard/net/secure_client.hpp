#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "clawguard/core/config.hpp"
#include "clawguard/core/error.hpp"
#include "clawguard/core/types.hpp"
#include "clawguard/net/audit.hpp"
#include "clawguard/net/dns_guard.hpp"
#include "clawguard/net/domain_classifier.hpp"
#include "clawguard/net/transport.hpp"

namespace clawguard::net {

/// Per-call options. Relaxations are opt-in and visible at the call site
/// through the builders below.
struct RequestOptions {
    std::optional<std::chrono::milliseconds> timeout;
    bool allow_private_ips = false;
    bool audit = false;
    HeaderMap headers;
    std::optional<std::string> correlation_id;
};

auto with_audit(RequestOptions options = {}) -> RequestOptions;
auto allow_private_ips(RequestOptions options = {}) -> RequestOptions;

/// Sets the timeout, clamped to [kMinTimeout, kMaxTimeout].
auto with_timeout(std::chrono::milliseconds timeout, RequestOptions options = {})
    -> RequestOptions;

struct RequestMeta {
    std::chrono::milliseconds duration{0};
    std::optional<std::string> correlation_id;
    int redirects = 0;
    std::string final_url;
};

struct HttpResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
    RequestMeta meta;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }

    /// Case-insensitive header lookup.
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;
};

/// Failed call. `status` is 0 unless a response was received (it carries
/// the original status for RESPONSE_TOO_LARGE).
struct RequestFailure {
    Error error;
    int status = 0;
    RequestMeta meta;

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return error.code(); }
    [[nodiscard]] auto code_string() const -> std::string_view {
        return error_code_to_string(error.code());
    }
};

using FetchResult = std::expected<HttpResponse, RequestFailure>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    RequestOptions options;
};

struct HealthStatus {
    bool healthy = false;
    int status = 0;
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> error;   // stable error code string
};

/// Validation steps run before dispatch, in this order.
enum class PipelineStage {
    UrlValidation,
    DnsRebinding,
    HeaderValidation,
};

auto pipeline_stage_name(PipelineStage stage) -> std::string_view;

/// Source of the ambient correlation ID.
using CorrelationProvider = std::function<std::optional<std::string>()>;

/// Collaborators of the client. Unset members get the built-in
/// implementations, except the audit sink: without one, nothing is audited.
struct ClientCollaborators {
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<HostResolver> resolver;
    std::shared_ptr<const DomainClassifier> classifier;
    std::shared_ptr<AuditSink> audit_sink;
    CorrelationProvider correlation;
};

/// HTTP client that validates every request before it reaches the network.
///
/// Each call runs URL validation, DNS rebinding validation (domain hosts)
/// and header validation, then dispatches with the connection pinned to the
/// validated address. Responses over the size limit are rejected. Redirects
/// are followed here, not by the transport, and every hop is validated
/// again. Security rejections are audited before they are returned.
///
/// Calls must be awaited on an executor that outlives them. Concurrent calls
/// share no mutable state.
class SecureHttpClient {
public:
    explicit SecureHttpClient(ClientConfig config = {}, ClientCollaborators collaborators = {});
    ~SecureHttpClient();

    SecureHttpClient(const SecureHttpClient&) = delete;
    SecureHttpClient& operator=(const SecureHttpClient&) = delete;

    auto get(std::string_view url, RequestOptions options = {})
        -> boost::asio::awaitable<FetchResult>;

    auto post(std::string_view url, std::string body, RequestOptions options = {})
        -> boost::asio::awaitable<FetchResult>;

    auto put(std::string_view url, std::string body, RequestOptions options = {})
        -> boost::asio::awaitable<FetchResult>;

    auto patch(std::string_view url, std::string body, RequestOptions options = {})
        -> boost::asio::awaitable<FetchResult>;

    auto delete_(std::string_view url, RequestOptions options = {})
        -> boost::asio::awaitable<FetchResult>;

    auto request(HttpRequest request) -> boost::asio::awaitable<FetchResult>;

    /// Bounded GET (default kHealthCheckTimeout) that never fails: any
    /// error is reported in the returned status.
    auto health_check(std::string_view url, RequestOptions options = {})
        -> boost::asio::awaitable<HealthStatus>;

    /// Runs the validation stages for `url` without dispatching.
    auto check(std::string_view url, RequestOptions options = {})
        -> boost::asio::awaitable<VoidResult>;

    [[nodiscard]] static auto pipeline_stages() -> const std::vector<PipelineStage>&;

    [[nodiscard]] auto config() const noexcept -> const ClientConfig& { return config_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    ClientConfig config_;
};

/// Builds a client with the production collaborators: httplib transport,
/// system resolver, heuristic classifier, a LogAuditSink writing to
/// `audit_log_path` (stderr when unset) and the ambient correlation ID.
auto make_secure_client(ClientConfig config = {},
                        std::optional<std::string> audit_log_path = std::nullopt)
    -> std::unique_ptr<SecureHttpClient>;

} // namespace clawguard::net
