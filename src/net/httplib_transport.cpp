#include "clawguard/net/transport.hpp"

#include "clawguard/core/logger.hpp"
#include "clawguard/core/redact.hpp"

#include <httplib.h>

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace clawguard::net {

namespace {

auto to_transport_error(httplib::Error err) -> Error {
    std::string detail;
    switch (err) {
        case httplib::Error::Connection:
            detail = "Connection failed";
            break;
        case httplib::Error::BindIPAddress:
            detail = "Bind IP address failed";
            break;
        case httplib::Error::Read:
            detail = "Read error";
            break;
        case httplib::Error::Write:
            detail = "Write error";
            break;
        case httplib::Error::Canceled:
            return make_error(ErrorCode::Cancelled,
                              "HTTP request cancelled", "request deadline exceeded");
        case httplib::Error::SSLConnection:
            detail = "SSL connection error";
            break;
        case httplib::Error::SSLLoadingCerts:
            detail = "SSL certificate loading error";
            break;
        case httplib::Error::SSLServerVerification:
            detail = "SSL server verification failed";
            break;
        case httplib::Error::ConnectionTimeout:
            return make_error(ErrorCode::Timeout,
                              "HTTP request timed out", "Connection timeout");
        default:
            detail = "httplib error " + httplib::to_string(err);
            break;
    }
    return make_error(ErrorCode::ConnectionFailed, "HTTP request failed", detail);
}

auto to_transport_response(const httplib::Response& res) -> TransportResponse {
    TransportResponse response;
    response.status = res.status;
    response.body = res.body;

    for (const auto& [key, value] : res.headers) {
        auto [it, inserted] = response.headers.emplace(key, value);
        if (!inserted) {
            it->second += ", " + value;
        }
    }
    return response;
}

/// Aborts the client's exchange when the token fires. httplib only consults
/// the progress callback while a body is moving; stop() also interrupts a
/// connect or a slow header read.
class StopOnCancel {
public:
    StopOnCancel(CancellationToken& token, httplib::ClientImpl& client) : token_(token) {
        token_.set_on_cancel([&client] { client.stop(); });
    }
    ~StopOnCancel() { token_.clear_on_cancel(); }

    StopOnCancel(const StopOnCancel&) = delete;
    StopOnCancel& operator=(const StopOnCancel&) = delete;

private:
    CancellationToken& token_;
};

} // anonymous namespace

struct HttplibTransport::Impl {
    HttplibTransportConfig config;
    boost::asio::thread_pool pool;

    explicit Impl(HttplibTransportConfig config_)
        : config(config_)
        , pool(static_cast<size_t>(std::max(1, config_.worker_threads))) {}

    auto make_client(const Url& url) -> Result<std::unique_ptr<httplib::ClientImpl>> {
        if (url.scheme == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            auto client = std::make_unique<httplib::SSLClient>(url.host, url.effective_port());
            client->enable_server_certificate_verification(config.verify_ssl);
            return std::unique_ptr<httplib::ClientImpl>(std::move(client));
#else
            return std::unexpected(make_error(ErrorCode::TransportError,
                                              "HTTPS is not supported by this build"));
#endif
        }
        if (url.scheme != "http") {
            return std::unexpected(make_error(ErrorCode::TransportError,
                                              "Unsupported URL scheme", url.scheme));
        }
        return std::make_unique<httplib::ClientImpl>(url.host, url.effective_port());
    }

    /// Runs on a pool thread.
    auto perform(const TransportRequest& request, CancellationToken& token)
        -> Result<TransportResponse>
    {
        if (token.is_cancelled()) {
            return std::unexpected(make_error(ErrorCode::Cancelled,
                                              "HTTP request cancelled", "before dispatch"));
        }

        auto client = make_client(request.url);
        if (!client) return std::unexpected(client.error());

        auto& cli = **client;
        cli.set_connection_timeout(request.timeout);
        cli.set_read_timeout(request.timeout);
        cli.set_write_timeout(request.timeout);
        cli.set_follow_location(false);
        if (request.pinned_address) {
            cli.set_hostname_addr_map({{request.url.host, *request.pinned_address}});
        }

        httplib::Request req;
        req.method = request.method;
        req.path = request.url.target;
        for (const auto& [key, value] : request.headers) {
            req.headers.emplace(key, value);
        }
        req.body = request.body;
        req.progress = [&token](uint64_t /*current*/, uint64_t /*total*/) {
            return !token.is_cancelled();
        };

        LOG_DEBUG("{} {}", request.method, mask_sensitive_data(request.url.to_string()));

        StopOnCancel stop_on_cancel(token, cli);
        if (token.is_cancelled()) {
            return std::unexpected(make_error(ErrorCode::Cancelled,
                                              "HTTP request cancelled", "before dispatch"));
        }

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        bool ok = cli.send(req, res, error);
        if (!ok) {
            if (token.is_cancelled()) {
                return std::unexpected(make_error(ErrorCode::Cancelled,
                                                  "HTTP request cancelled",
                                                  "request deadline exceeded"));
            }
            return std::unexpected(to_transport_error(error));
        }
        return to_transport_response(res);
    }
};

HttplibTransport::HttplibTransport(HttplibTransportConfig config)
    : impl_(std::make_unique<Impl>(config)) {}

HttplibTransport::~HttplibTransport() {
    impl_->pool.join();
}

auto HttplibTransport::send(TransportRequest request, std::shared_ptr<CancellationToken> token)
    -> boost::asio::awaitable<Result<TransportResponse>>
{
    // Offload the blocking httplib exchange to the pool; the result is
    // delivered back on the awaiting coroutine's executor.
    auto result = co_await boost::asio::co_spawn(
        impl_->pool.get_executor(),
        [impl = impl_.get(), req = std::move(request), token = std::move(token)]()
            -> boost::asio::awaitable<Result<TransportResponse>> {
            try {
                co_return impl->perform(req, *token);
            } catch (const std::exception& e) {
                co_return make_fail(make_error(ErrorCode::TransportError,
                                               "HTTP transport raised an exception", e.what()));
            }
        },
        boost::asio::use_awaitable);

    co_return result;
}

} // namespace clawguard::net
