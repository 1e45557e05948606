#include "core/rate_limiter.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>

namespace loadpulse {
namespace core {

namespace {

using Seconds = std::chrono::duration<double>;

} // namespace

RateLimiter::RateLimiter(double rate)
    : rate_(rate), tokens_(0.0), last_refill_(Clock::now()), cancelled_(false) {
    if (!(rate >= utils::kMinQps && rate <= utils::kMaxQps)) {
        throw utils::InvalidConfigurationException("Rate must be between " + std::to_string(utils::kMinQps) +
                                                   " and " + std::to_string(utils::kMaxQps),
                                                   "rate=" + std::to_string(rate));
    }
}

void RateLimiter::refill(Clock::time_point now) {
    // last_refill_ lies in the future while a waiter's token is reserved
    if (now <= last_refill_) {
        return;
    }
    double elapsed = std::chrono::duration_cast<Seconds>(now - last_refill_).count();
    tokens_ = std::min(rate_, tokens_ + elapsed * rate_);
    last_refill_ = now;
}

bool RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }

    auto now = Clock::now();
    refill(now);

    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }

    // Reserve the interval that produces this caller's token, so later
    // callers refill from the end of it instead of reusing it
    Seconds deficit{(1.0 - tokens_) / rate_};
    last_refill_ += std::chrono::duration_cast<Clock::duration>(deficit);
    tokens_ = 0.0;
    auto ready_at = last_refill_;

    // wait_until releases mutex_ while sleeping
    bool cancelled = wake_.wait_until(lock, ready_at, [this] { return cancelled_; });
    return !cancelled;
}

void RateLimiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    wake_.notify_all();
}

bool RateLimiter::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

double RateLimiter::availableTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (now <= last_refill_) {
        return tokens_;
    }
    double elapsed = std::chrono::duration_cast<Seconds>(now - last_refill_).count();
    return std::min(rate_, tokens_ + elapsed * rate_);
}

} // namespace core
} // namespace loadpulse
