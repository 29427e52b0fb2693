#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "clawguard/core/error.hpp"
#include "clawguard/core/types.hpp"
#include "clawguard/net/constants.hpp"
#include "clawguard/net/lifecycle.hpp"
#include "clawguard/net/url.hpp"

namespace clawguard::net {

/// One validated HTTP exchange handed to the network layer.
struct TransportRequest {
    std::string method = "GET";
    Url url;
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds timeout = kDefaultTimeout;
    /// Address the DNS guard approved for url.host; the transport connects
    /// there instead of resolving the name again.
    std::optional<std::string> pinned_address;
};

/// Buffered response as received; redirects are not followed.
struct TransportResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
};

/// Network seam of the client. Implementations never throw out of send();
/// failures come back as Timeout, ConnectionFailed, Cancelled or
/// TransportError.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto send(TransportRequest request, std::shared_ptr<CancellationToken> token)
        -> boost::asio::awaitable<Result<TransportResponse>> = 0;
};

struct HttplibTransportConfig {
    bool verify_ssl = true;
    int worker_threads = 4;
};

/// cpp-httplib transport. The blocking exchange runs on an internal thread
/// pool; the awaiting coroutine resumes on its own executor.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(HttplibTransportConfig config = {});
    ~HttplibTransport() override;

    HttplibTransport(const HttplibTransport&) = delete;
    HttplibTransport& operator=(const HttplibTransport&) = delete;

    auto send(TransportRequest request, std::shared_ptr<CancellationToken> token)
        -> boost::asio::awaitable<Result<TransportResponse>> override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace clawguard::net
