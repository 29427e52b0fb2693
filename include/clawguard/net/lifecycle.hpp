#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "clawguard/net/constants.hpp"

namespace clawguard::net {

/// Clamps a caller-supplied timeout to [kMinTimeout, kMaxTimeout].
[[nodiscard]] constexpr auto clamp_timeout(std::chrono::milliseconds requested) noexcept
    -> std::chrono::milliseconds {
    if (requested < kMinTimeout) return kMinTimeout;
    if (requested > kMaxTimeout) return kMaxTimeout;
    return requested;
}

/// Cancellation flag shared between a request and its transport. The
/// transport polls it while data is moving and registers an on-cancel hook
/// to abort an exchange that is blocked between reads.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    /// Sets the flag and runs the registered hook, once.
    void cancel() {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
        if (on_cancel_) on_cancel_();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Registers the hook, replacing any previous one. Runs it immediately
    /// when the token is already cancelled.
    void set_on_cancel(Callback callback) {
        std::lock_guard lock(mutex_);
        if (cancelled_.load(std::memory_order_acquire)) {
            callback();
            return;
        }
        on_cancel_ = std::move(callback);
    }

    /// Removes the hook. Once this returns the hook is not running and will
    /// not run again.
    void clear_on_cancel() {
        std::lock_guard lock(mutex_);
        on_cancel_ = nullptr;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    Callback on_cancel_;
};

/// Per-request deadline. Arms a timer at timeout + grace that cancels the
/// token; cleanup() disarms it. cleanup() is idempotent and also runs from
/// the destructor, so every exit path releases the timer exactly once.
class RequestLifecycle {
public:
    RequestLifecycle(const boost::asio::any_io_executor& executor,
                     std::chrono::milliseconds timeout,
                     std::chrono::milliseconds grace = kTimeoutGrace);
    ~RequestLifecycle();

    RequestLifecycle(const RequestLifecycle&) = delete;
    RequestLifecycle& operator=(const RequestLifecycle&) = delete;

    [[nodiscard]] auto token() const noexcept -> const std::shared_ptr<CancellationToken>& {
        return token_;
    }

    /// Cancels the pending deadline. Safe to call any number of times.
    void cleanup() noexcept;

    [[nodiscard]] auto is_armed() const noexcept -> bool { return armed_; }

    /// Time from arming to forced cancellation.
    [[nodiscard]] auto deadline() const noexcept -> std::chrono::milliseconds { return deadline_; }

private:
    std::shared_ptr<CancellationToken> token_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds deadline_;
    bool armed_ = false;
};

} // namespace clawguard::net
