/**
 * @file retry.cpp
 * @brief Timeout and bounded exponential-backoff retry around recognizer calls
 *
 * This is the only place in the pipeline where work is retried. Retry
 * decisions read RecognizerFault::retryable and nothing else.
 */

#include "retry.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

namespace platerec {

namespace {

RecognizeOutcome cancelled_outcome()
{
    return RecognizeOutcome::failure(RecognizerFaultKind::REQUEST_CANCELLED,
                                     "Request was cancelled", false);
}

// Shared between the waiting caller and the worker thread
struct TimeoutRace {
    std::mutex mutex;
    std::condition_variable cv;
    bool done;
    bool cancelled;
    RecognizeOutcome outcome;

    TimeoutRace() : done(false), cancelled(false) {}
};

} // anonymous namespace

int64_t compute_backoff_delay(const RetryConfig& config, uint32_t retry_index)
{
    const double cap = static_cast<double>(config.max_delay_ms);
    double delay = std::min(static_cast<double>(config.initial_delay_ms), cap);

    for (uint32_t i = 0; i < retry_index && delay < cap; ++i) {
        delay = std::min(delay * config.backoff_multiplier, cap);
    }

    return static_cast<int64_t>(delay);
}

RecognizeOutcome with_timeout(const RecognizeOperation& op, int64_t timeout_ms,
                              const CancellationToken& cancel)
{
    if (cancel.is_cancelled()) {
        return cancelled_outcome();
    }

    std::shared_ptr<TimeoutRace> race = std::make_shared<TimeoutRace>();
    CancellationToken attempt_token;

    // Caller cancellation stops our wait and is forwarded to the attempt
    CancellationRegistration link(cancel, [race, attempt_token]() {
        attempt_token.cancel();
        {
            std::lock_guard<std::mutex> lock(race->mutex);
            race->cancelled = true;
        }
        race->cv.notify_all();
    });

    try {
        std::thread worker([op, attempt_token, race]() {
            RecognizeOutcome outcome;
            try {
                outcome = op(attempt_token);
            }
            catch (const std::exception& e) {
                outcome = RecognizeOutcome::failure(RecognizerFaultKind::UNKNOWN, e.what(), true);
            }
            catch (...) {
                outcome = RecognizeOutcome::failure(RecognizerFaultKind::UNKNOWN,
                                                    "Recognizer raised a non-standard exception", true);
            }

            {
                std::lock_guard<std::mutex> lock(race->mutex);
                race->outcome = outcome;
                race->done = true;
            }
            race->cv.notify_all();
        });
        worker.detach();
    }
    catch (const std::system_error& e) {
        return RecognizeOutcome::failure(RecognizerFaultKind::API_CONNECTION_FAILED,
                                         std::string("Cannot start recognizer worker: ") + e.what(),
                                         true);
    }

    std::unique_lock<std::mutex> lock(race->mutex);
    TimeoutRace* state = race.get();
    auto finished = [state]() { return state->done || state->cancelled; };

    if (timeout_ms > 0) {
        race->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), finished);
    }
    else {
        race->cv.wait(lock, finished);
    }

    if (race->done) {
        return race->outcome;
    }

    if (race->cancelled) {
        return cancelled_outcome();
    }

    lock.unlock();
    attempt_token.cancel();
    return RecognizeOutcome::failure(RecognizerFaultKind::TIMEOUT, "Recognition timed out", true);
}

RecognizeOutcome with_retry(const RecognizeOperation& op, const RetryConfig& config,
                            const CancellationToken& cancel, RetryTrace* trace)
{
    RecognizeOutcome last;

    for (uint32_t attempt = 0; attempt <= config.max_retries; ++attempt) {
        if (cancel.is_cancelled()) {
            return cancelled_outcome();
        }

        if (trace) {
            trace->attempts++;
        }

        try {
            last = op(cancel);
        }
        catch (const std::exception& e) {
            last = RecognizeOutcome::failure(RecognizerFaultKind::UNKNOWN, e.what(), true);
        }
        catch (...) {
            last = RecognizeOutcome::failure(RecognizerFaultKind::UNKNOWN,
                                             "Recognizer raised a non-standard exception", true);
        }

        if (last.ok || !last.fault.retryable) {
            return last;
        }

        // No wait after the final attempt
        if (attempt < config.max_retries) {
            const int64_t delay = compute_backoff_delay(config, attempt);
            if (trace) {
                trace->delays_ms.push_back(delay);
            }
            if (cancel.wait_for(delay)) {
                return cancelled_outcome();
            }
        }
    }

    if (last.fault.kind == RecognizerFaultKind::UNKNOWN) {
        last.fault.kind = RecognizerFaultKind::API_CONNECTION_FAILED;
        if (last.fault.message.empty()) {
            last.fault.message = "Cannot connect to the recognition service";
        }
        last.fault.retryable = false;
    }

    return last;
}

} // namespace platerec
