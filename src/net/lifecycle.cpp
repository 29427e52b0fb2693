#include "clawguard/net/lifecycle.hpp"

#include "clawguard/core/logger.hpp"

namespace clawguard::net {

RequestLifecycle::RequestLifecycle(const boost::asio::any_io_executor& executor,
                                   std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds grace)
    : token_(std::make_shared<CancellationToken>())
    , timer_(executor)
    , deadline_(timeout + grace)
{
    timer_.expires_after(deadline_);
    timer_.async_wait([token = token_, deadline = deadline_](const boost::system::error_code& ec) {
        if (ec) return;  // disarmed
        LOG_WARN("Request exceeded its {}ms deadline, cancelling", deadline.count());
        try {
            token->cancel();
        } catch (const std::exception& e) {
            LOG_ERROR("Cancellation hook failed: {}", e.what());
        }
    });
    armed_ = true;
}

RequestLifecycle::~RequestLifecycle() {
    cleanup();
}

void RequestLifecycle::cleanup() noexcept {
    if (!armed_) return;
    armed_ = false;
    try {
        timer_.cancel();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to disarm request deadline: {}", e.what());
    }
}

} // namespace clawguard::net
