#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace loadpulse {
namespace core {

/**
 * Token-bucket admission gate shared by all workers of a run.
 *
 * Tokens refill continuously at `rate` per second up to a capacity of
 * `rate` (one second's worth). Refill is computed lazily on each acquire,
 * there is no background timer. The bucket starts empty.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param rate Admissions per second, within [utils::kMinQps, utils::kMaxQps]
     * @throws utils::InvalidConfigurationException on a bad rate
     */
    explicit RateLimiter(double rate);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Block until one token is available, then consume it.
     * The wait happens outside the lock; admission order between waiting
     * threads is not guaranteed.
     * @return true when admitted, false if cancel() ended the wait
     */
    bool acquire();

    /**
     * Wake every waiting caller and make later acquire() calls return
     * false immediately. Used to stop a run without waiting out
     * reservations.
     */
    void cancel();

    bool isCancelled() const;

    /**
     * Balance as of now, including pending refill. Does not consume.
     */
    double availableTokens() const;

    double rate() const { return rate_; }

private:
    // Caller holds mutex_
    void refill(Clock::time_point now);

    const double rate_;
    double tokens_;
    Clock::time_point last_refill_;
    bool cancelled_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
};

} // namespace core
} // namespace loadpulse
