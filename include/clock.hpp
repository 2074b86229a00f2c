#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace platerec {

/**
 * @brief Millisecond time source
 *
 * Every stateful component reads time through this interface so tests can
 * drive TTLs, sliding windows and suppression windows deterministically.
 */
class Clock {
public:
    virtual ~Clock() {}

    /**
     * @brief Current time in milliseconds (monotonic, arbitrary epoch)
     */
    virtual int64_t now_ms() const = 0;

    /**
     * @brief Process-wide steady clock used when no clock is injected
     */
    static const Clock& steady();
};

/**
 * Steady clock backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
};

inline const Clock& Clock::steady() {
    static const SteadyClock instance;
    return instance;
}

/**
 * Manually advanced clock for tests and replay
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override { return now_.load(); }

    void set(int64_t ms) { now_.store(ms); }
    void advance(int64_t ms) { now_.fetch_add(ms); }

private:
    std::atomic<int64_t> now_;
};

} // namespace platerec
