#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include "clock.hpp"

namespace platerec {

/**
 * Admission limits
 */
struct RateLimitConfig {
    uint32_t max_concurrent = 100;
    int64_t window_ms = 60000;      // Sliding window length
    uint32_t max_requests = 100;    // Requests allowed per window
};

struct RateLimitStats {
    uint32_t current_concurrent;
    uint32_t requests_in_window;
    uint32_t max_concurrent;
    uint32_t max_requests;

    RateLimitStats()
        : current_concurrent(0), requests_in_window(0), max_concurrent(0), max_requests(0) {}
};

/**
 * @brief Concurrency cap plus sliding-window request cap
 *
 * Window timestamps are pruned lazily on can_accept()/stats(); there is no
 * background timer. All methods are internally synchronized.
 */
class RateLimiter {
public:
    explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig(),
                         const Clock* clock = nullptr);

    /**
     * @brief True if both gates admit another request
     */
    bool can_accept();

    // Record an admitted request
    void start();

    // Release a concurrency slot; never drops below zero
    void end();

    /**
     * @brief Check and start under one lock
     * @return false (and no state change) if rejected
     */
    bool try_start();

    RateLimitStats stats();

    // Forget all in-flight counts and window history
    void reset();

    const RateLimitConfig& config() const { return config_; }

private:
    RateLimitConfig config_;
    const Clock& clock_;

    std::mutex mutex_;
    uint32_t current_concurrent_;
    std::deque<int64_t> request_timestamps_;   // Ascending

    void prune_locked(int64_t now);
    bool admits_locked() const;
};

/**
 * @brief RAII admission slot
 *
 * Calls RateLimiter::end() on destruction if the slot was acquired, so every
 * exit path (success, failure, timeout, cancellation) releases it.
 */
class RateLimitSlot {
public:
    explicit RateLimitSlot(RateLimiter& limiter);
    ~RateLimitSlot();

    RateLimitSlot(const RateLimitSlot&) = delete;
    RateLimitSlot& operator=(const RateLimitSlot&) = delete;

    bool acquired() const { return acquired_; }

private:
    RateLimiter& limiter_;
    bool acquired_;
};

} // namespace platerec
