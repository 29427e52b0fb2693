#include "clawguard/net/secure_client.hpp"

#include "clawguard/core/correlation.hpp"
#include "clawguard/core/logger.hpp"
#include "clawguard/core/redact.hpp"
#include "clawguard/core/utils.hpp"
#include "clawguard/net/header_sanitizer.hpp"
#include "clawguard/net/ip_classifier.hpp"
#include "clawguard/net/lifecycle.hpp"
#include "clawguard/net/response_governor.hpp"
#include "clawguard/net/url.hpp"
#include "clawguard/net/url_validator.hpp"

#include <algorithm>
#include <set>

#include <boost/asio/this_coro.hpp>

namespace clawguard::net {

namespace asio = boost::asio;
using std::chrono::milliseconds;

namespace {

/// Headers that must not follow a redirect to another origin.
const std::vector<std::string> kCrossOriginSensitiveHeaders = {
    "Authorization", "Cookie", "Proxy-Authorization",
};

// Builds the failure outside the coroutine frame (same GCC 14 issue as
// make_fail in error.hpp).
auto reject(Error error, int status = 0) -> FetchResult {
    return std::unexpected(RequestFailure{std::move(error), status, {}});
}

auto is_redirect_status(int status) -> bool {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> milliseconds {
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);
}

auto masked_url(std::string_view url) -> std::string {
    return mask_sensitive_data(sanitize_for_log(url));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Option builders
// ---------------------------------------------------------------------------

auto with_audit(RequestOptions options) -> RequestOptions {
    options.audit = true;
    return options;
}

auto allow_private_ips(RequestOptions options) -> RequestOptions {
    options.allow_private_ips = true;
    return options;
}

auto with_timeout(milliseconds timeout, RequestOptions options) -> RequestOptions {
    options.timeout = clamp_timeout(timeout);
    return options;
}

auto HttpResponse::header(std::string_view name) const -> std::optional<std::string> {
    return find_header(headers, name);
}

auto pipeline_stage_name(PipelineStage stage) -> std::string_view {
    switch (stage) {
        case PipelineStage::UrlValidation: return "url_validation";
        case PipelineStage::DnsRebinding: return "dns_rebinding";
        case PipelineStage::HeaderValidation: return "header_validation";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct SecureHttpClient::Impl {
    ClientConfig config;
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<const DomainClassifier> classifier;
    DnsGuard dns_guard;
    AuditEmitter audit;
    CorrelationProvider correlation_provider;

    /// A URL that passed the URL and DNS stages.
    struct Target {
        Url url;
        std::optional<std::string> pinned_address;
    };

    Impl(ClientConfig config_, ClientCollaborators c)
        : config(std::move(config_))
        , transport(c.transport ? std::move(c.transport)
                                : std::make_shared<HttplibTransport>(HttplibTransportConfig{
                                      .verify_ssl = config.verify_ssl,
                                      .worker_threads = config.worker_threads,
                                  }))
        , classifier(c.classifier ? std::move(c.classifier)
                                  : std::make_shared<HeuristicDomainClassifier>())
        , dns_guard(c.resolver ? std::move(c.resolver) : std::make_shared<AsioHostResolver>(),
                    config.dns_lookup_timeout_ms > 0 ? milliseconds(config.dns_lookup_timeout_ms)
                                                     : kDnsLookupTimeout)
        , audit(std::move(c.audit_sink))
        , correlation_provider(c.correlation ? std::move(c.correlation)
                                    : CorrelationProvider([] { return correlation::current_id(); })) {}

    auto resolve_correlation_id(const RequestOptions& options) const -> std::optional<std::string> {
        if (options.correlation_id) {
            return correlation::sanitize_id(*options.correlation_id);
        }
        return correlation_provider();
    }

    /// Configured size limit; a non-positive value falls back to kMaxResponseSize.
    auto response_limit() const -> size_t {
        return config.max_response_bytes > 0 ? static_cast<size_t>(config.max_response_bytes)
                                             : kMaxResponseSize;
    }

    auto user_agent() const -> std::string {
        return config.user_agent.empty() ? std::string(kUserAgent) : config.user_agent;
    }

    /// UrlValidation then DnsRebinding (domain hosts only).
    auto validate_target(const std::string& url, bool allow_private,
                         const std::optional<std::string>& correlation_id)
        -> asio::awaitable<Result<Target>>
    {
        auto verdict = validate_url_ssrf(url, *classifier, {.allow_private_ips = allow_private});
        if (!verdict) {
            auto reason = verdict.error.value_or("URL rejected");
            LOG_WARN("SSRF protection blocked {}: {}", masked_url(url), reason);
            co_await audit.ssrf_attempt(url, reason, correlation_id);
            co_return make_fail(make_error(ErrorCode::SsrfViolation, "SSRF Protection", reason));
        }

        auto parsed = parse_url(url);
        if (!parsed) {
            co_return make_fail(parsed.error());
        }

        Target target{std::move(*parsed), std::nullopt};
        if (is_ip_literal(target.url.host)) {
            co_return target;
        }

        auto dns = co_await dns_guard.validate(target.url.host,
                                               {.allow_private_ips = allow_private});
        if (!dns) {
            auto reason = dns.error.value_or("DNS validation failed");
            if (dns.resolved_ip) {
                LOG_WARN("DNS rebinding protection blocked {}: {}", masked_url(url), reason);
                co_await audit.dns_rebinding_attempt(url, target.url.host, reason,
                                                     dns.resolved_ip, correlation_id);
                co_return make_fail(make_error(ErrorCode::DnsRebindingViolation,
                                               "DNS Protection", reason));
            }
            // Unresolvable hosts are never reachable.
            co_return make_fail(make_error(ErrorCode::ConnectionFailed, reason));
        }

        target.pinned_address = dns.resolved_ip;
        co_return target;
    }

    /// HeaderValidation. Returns the headers to transmit.
    auto validate_headers(const HeaderMap& headers, const std::string& url,
                          const std::optional<std::string>& correlation_id)
        -> asio::awaitable<Result<HeaderMap>>
    {
        auto checked = validate_and_sanitize_headers(headers);
        if (!checked) {
            auto reason = checked.error.value_or("invalid header");
            LOG_WARN("Header validation failed for {}: {}", masked_url(url), reason);
            co_await audit.header_injection(url, reason, correlation_id);
            co_return make_fail(make_error(ErrorCode::HeaderValidationFailed,
                                           "Header Security", reason));
        }
        for (const auto& [name, value] : checked.loggable) {
            const bool credential = std::ranges::any_of(kCrossOriginSensitiveHeaders,
                [&name](const std::string& h) { return utils::iequals(h, name); });
            LOG_DEBUG("Request header {}: {}", name,
                      credential ? std::string("[REDACTED]") : mask_sensitive_data(value));
        }
        co_return std::move(checked.sanitized);
    }

    /// Validates and dispatches each hop of the redirect chain.
    auto dispatch_chain(const HttpRequest& request, milliseconds timeout,
                        const std::shared_ptr<CancellationToken>& token, RequestMeta& meta)
        -> asio::awaitable<FetchResult>
    {
        const auto& options = request.options;
        const bool allow_private = options.allow_private_ips || config.allow_private_ips;

        std::string method = utils::to_upper(request.method);
        std::string body = request.body;
        std::string current = request.url;
        std::set<std::string> visited;
        HeaderMap headers;
        std::optional<Url> previous;

        for (int hop = 0;; ++hop) {
            auto target = co_await validate_target(current, allow_private, meta.correlation_id);
            if (!target) {
                co_return reject(target.error());
            }

            if (!previous) {
                auto checked = co_await validate_headers(options.headers, current,
                                                         meta.correlation_id);
                if (!checked) {
                    co_return reject(checked.error());
                }
                headers = std::move(*checked);

                erase_header(headers, "User-Agent");
                headers["User-Agent"] = user_agent();
                if (meta.correlation_id) {
                    erase_header(headers, correlation::kHeaderName);
                    headers[std::string(correlation::kHeaderName)] = *meta.correlation_id;
                }
                if (!body.empty() && !find_header(headers, "Content-Type")) {
                    headers["Content-Type"] = "application/json";
                }
            } else if (previous->origin() != target->url.origin()) {
                LOG_DEBUG("Cross-origin redirect from {} to {}, dropping credentials",
                          previous->origin(), target->url.origin());
                for (const auto& name : kCrossOriginSensitiveHeaders) {
                    erase_header(headers, name);
                }
            }

            auto key = target->url.to_string();
            if (!visited.insert(key).second) {
                co_return reject(make_error(ErrorCode::TooManyRedirects,
                                            "Redirect loop detected", masked_url(key)));
            }
            meta.final_url = masked_url(key);

            if (token->is_cancelled()) {
                co_return reject(make_error(ErrorCode::Timeout, "Request exceeded deadline",
                                            std::to_string(timeout.count()) + "ms"));
            }

            LOG_DEBUG("{} {} (hop {})", method, masked_url(key), hop);
            TransportRequest outbound{
                .method = method,
                .url = target->url,
                .headers = headers,
                .body = body,
                .timeout = timeout,
                .pinned_address = target->pinned_address,
            };
            auto response = co_await transport->send(std::move(outbound), token);
            if (!response) {
                if (token->is_cancelled()) {
                    co_return reject(make_error(ErrorCode::Timeout, "Request exceeded deadline",
                                                std::to_string(timeout.count()) + "ms"));
                }
                co_return reject(response.error());
            }

            const auto limit = response_limit();
            if (!validate_response_size(*response, limit)) {
                LOG_WARN("Response from {} exceeds {} bytes", masked_url(key), limit);
                co_await audit.oversized_response(key, response->status,
                                                  find_header(response->headers, "Content-Length"),
                                                  meta.correlation_id);
                co_return reject(make_error(ErrorCode::ResponseTooLarge,
                                            "Response size exceeds maximum allowed",
                                            "max=" + std::to_string(limit)),
                                 response->status);
            }

            auto location = find_header(response->headers, "Location");
            if (config.max_redirects > 0 && is_redirect_status(response->status) &&
                location && !location->empty())
            {
                if (hop >= config.max_redirects) {
                    co_return reject(make_error(ErrorCode::TooManyRedirects, "Too many redirects",
                                                "max=" + std::to_string(config.max_redirects)),
                                     response->status);
                }

                auto next = resolve_reference(target->url, *location);
                if (!next) {
                    co_return reject(make_error(ErrorCode::InvalidArgument,
                                                "Invalid redirect location",
                                                sanitize_for_log(*location)),
                                     response->status);
                }

                // 303 always, and 301/302 after POST, continue as a body-less GET.
                if (response->status == 303 ||
                    ((response->status == 301 || response->status == 302) && method == "POST"))
                {
                    if (method != "HEAD") method = "GET";
                    body.clear();
                    erase_header(headers, "Content-Type");
                    erase_header(headers, "Content-Length");
                }

                previous = target->url;
                current = next->to_string();
                meta.redirects = hop + 1;
                continue;
            }

            HttpResponse result;
            result.status = response->status;
            result.headers = std::move(response->headers);
            result.body = std::move(response->body);
            co_return result;
        }
    }

    auto run(HttpRequest request) -> asio::awaitable<FetchResult> {
        const auto started = std::chrono::steady_clock::now();

        RequestMeta meta;
        meta.correlation_id = resolve_correlation_id(request.options);
        meta.final_url = masked_url(request.url);

        auto timeout = clamp_timeout(
            request.options.timeout.value_or(milliseconds(config.default_timeout_ms)));

        auto executor = co_await asio::this_coro::executor;
        RequestLifecycle lifecycle(executor, timeout);

        auto outcome = co_await dispatch_chain(request, timeout, lifecycle.token(), meta);
        lifecycle.cleanup();

        meta.duration = elapsed_since(started);
        const bool audited = request.options.audit || config.audit;
        const auto method = utils::to_upper(request.method);

        if (outcome) {
            if (audited) {
                co_await audit.call_succeeded(request.url, method, outcome->status,
                                              meta.duration.count(), meta.correlation_id);
            }
            outcome->meta = std::move(meta);
        } else {
            if (audited) {
                co_await audit.call_failed(request.url, method, outcome.error().code_string(),
                                           meta.duration.count(), meta.correlation_id);
            }
            if (is_security_rejection(outcome.error().code())) {
                LOG_WARN("{} {} rejected: {} ({})", method, meta.final_url,
                         outcome.error().error.what(), outcome.error().code_string());
            } else {
                LOG_DEBUG("{} {} failed: {} ({})", method, meta.final_url,
                          outcome.error().error.what(), outcome.error().code_string());
            }
            outcome.error().meta = std::move(meta);
        }
        co_return outcome;
    }
};

// ---------------------------------------------------------------------------
// SecureHttpClient
// ---------------------------------------------------------------------------

SecureHttpClient::SecureHttpClient(ClientConfig config, ClientCollaborators collaborators)
    : impl_(std::make_unique<Impl>(config, std::move(collaborators)))
    , config_(std::move(config)) {}

SecureHttpClient::~SecureHttpClient() = default;

auto SecureHttpClient::get(std::string_view url, RequestOptions options)
    -> asio::awaitable<FetchResult>
{
    co_return co_await request({"GET", std::string(url), {}, std::move(options)});
}

auto SecureHttpClient::post(std::string_view url, std::string body, RequestOptions options)
    -> asio::awaitable<FetchResult>
{
    co_return co_await request({"POST", std::string(url), std::move(body), std::move(options)});
}

auto SecureHttpClient::put(std::string_view url, std::string body, RequestOptions options)
    -> asio::awaitable<FetchResult>
{
    co_return co_await request({"PUT", std::string(url), std::move(body), std::move(options)});
}

auto SecureHttpClient::patch(std::string_view url, std::string body, RequestOptions options)
    -> asio::awaitable<FetchResult>
{
    co_return co_await request({"PATCH", std::string(url), std::move(body), std::move(options)});
}

auto SecureHttpClient::delete_(std::string_view url, RequestOptions options)
    -> asio::awaitable<FetchResult>
{
    co_return co_await request({"DELETE", std::string(url), {}, std::move(options)});
}

auto SecureHttpClient::request(HttpRequest request) -> asio::awaitable<FetchResult> {
    co_return co_await impl_->run(std::move(request));
}

auto SecureHttpClient::health_check(std::string_view url, RequestOptions options)
    -> asio::awaitable<HealthStatus>
{
    const auto started = std::chrono::steady_clock::now();
    if (!options.timeout) {
        options.timeout = kHealthCheckTimeout;
    }

    auto result = co_await get(url, std::move(options));

    HealthStatus status;
    status.response_time = elapsed_since(started);
    if (result) {
        status.healthy = result->is_success();
        status.status = result->status;
    } else {
        status.status = result.error().status;
        status.error = std::string(result.error().code_string());
    }
    co_return status;
}

auto SecureHttpClient::check(std::string_view url, RequestOptions options)
    -> asio::awaitable<VoidResult>
{
    const bool allow_private = options.allow_private_ips || config_.allow_private_ips;
    auto correlation_id = impl_->resolve_correlation_id(options);
    std::string target_url(url);

    auto target = co_await impl_->validate_target(target_url, allow_private, correlation_id);
    if (!target) {
        co_return make_fail(target.error());
    }
    auto headers = co_await impl_->validate_headers(options.headers, target_url, correlation_id);
    if (!headers) {
        co_return make_fail(headers.error());
    }
    co_return ok_result();
}

auto SecureHttpClient::pipeline_stages() -> const std::vector<PipelineStage>& {
    static const std::vector<PipelineStage> stages = {
        PipelineStage::UrlValidation,
        PipelineStage::DnsRebinding,
        PipelineStage::HeaderValidation,
    };
    return stages;
}

auto make_secure_client(ClientConfig config, std::optional<std::string> audit_log_path)
    -> std::unique_ptr<SecureHttpClient>
{
    ClientCollaborators collaborators;
    collaborators.audit_sink = LogAuditSink::create(audit_log_path);
    return std::make_unique<SecureHttpClient>(std::move(config), std::move(collaborators));
}

} // namespace clawguard::net
