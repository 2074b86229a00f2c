#include "rate_limiter.hpp"

namespace platerec {

RateLimiter::RateLimiter(const RateLimitConfig& config, const Clock* clock)
    : config_(config)
    , clock_(clock ? *clock : Clock::steady())
    , current_concurrent_(0)
{
}

bool RateLimiter::can_accept()
{
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(clock_.now_ms());
    return admits_locked();
}

void RateLimiter::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_concurrent_++;
    request_timestamps_.push_back(clock_.now_ms());
}

void RateLimiter::end()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_concurrent_ > 0) {
        current_concurrent_--;
    }
}

bool RateLimiter::try_start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = clock_.now_ms();

    prune_locked(now);
    if (!admits_locked()) {
        return false;
    }

    current_concurrent_++;
    request_timestamps_.push_back(now);
    return true;
}

RateLimitStats RateLimiter::stats()
{
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(clock_.now_ms());

    RateLimitStats s;
    s.current_concurrent = current_concurrent_;
    s.requests_in_window = static_cast<uint32_t>(request_timestamps_.size());
    s.max_concurrent = config_.max_concurrent;
    s.max_requests = config_.max_requests;
    return s;
}

void RateLimiter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_concurrent_ = 0;
    request_timestamps_.clear();
}

void RateLimiter::prune_locked(int64_t now)
{
    // Keep timestamps strictly inside (now - window, now]
    const int64_t window_start = now - config_.window_ms;
    while (!request_timestamps_.empty() && request_timestamps_.front() <= window_start) {
        request_timestamps_.pop_front();
    }
}

bool RateLimiter::admits_locked() const
{
    if (current_concurrent_ >= config_.max_concurrent) {
        return false;
    }
    return request_timestamps_.size() < config_.max_requests;
}

// ============================================================================
// RateLimitSlot
// ============================================================================

RateLimitSlot::RateLimitSlot(RateLimiter& limiter)
    : limiter_(limiter)
    , acquired_(limiter.try_start())
{
}

RateLimitSlot::~RateLimitSlot()
{
    if (acquired_) {
        limiter_.end();
    }
}

} // namespace platerec
