#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace platerec {

/**
 * @brief Cooperative cancellation handle
 *
 * Copies share state: cancelling any copy cancels all of them. Cancellation
 * stops waits inside the pipeline; whether a remote call in flight actually
 * stops is up to the recognizer observing the token.
 */
class CancellationToken {
public:
    typedef uint64_t CallbackId;

    CancellationToken();

    void cancel() const;

    bool is_cancelled() const;

    /**
     * @brief Sleep for up to `ms`, waking early on cancellation
     * @return true if the token is cancelled
     */
    bool wait_for(int64_t ms) const;

    /**
     * @brief Register a callback run once on cancellation
     *
     * Runs immediately on the calling thread if already cancelled, in which
     * case 0 is returned. Callbacks run outside the token's lock.
     */
    CallbackId on_cancel(std::function<void()> callback) const;

    void remove_callback(CallbackId id) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled;
        CallbackId next_id;
        std::map<CallbackId, std::function<void()>> callbacks;

        State() : cancelled(false), next_id(1) {}
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Scoped on_cancel registration, removed on destruction
 */
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    CancellationToken::CallbackId id_;
};

} // namespace platerec
