#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include "cancellation.hpp"
#include "recognizer.hpp"

namespace platerec {

/**
 * Retry policy for retryable recognizer faults
 */
struct RetryConfig {
    uint32_t max_retries = 3;           // Attempts = max_retries + 1
    int64_t initial_delay_ms = 1000;
    int64_t max_delay_ms = 5000;
    double backoff_multiplier = 2.0;
};

/**
 * Optional record of what with_retry did
 */
struct RetryTrace {
    uint32_t attempts;
    std::vector<int64_t> delays_ms;

    RetryTrace() : attempts(0) {}
};

/**
 * Unit of work wrapped by the orchestrator. The token it receives is
 * cancelled when the caller stops waiting for it.
 */
typedef std::function<RecognizeOutcome(const CancellationToken&)> RecognizeOperation;

/**
 * @brief Delay before retry number `retry_index` (0-based)
 * @return min(initial * multiplier^retry_index, max_delay)
 */
int64_t compute_backoff_delay(const RetryConfig& config, uint32_t retry_index);

/**
 * @brief Race `op` against a timer and the caller's cancellation
 *
 * `op` runs on a detached worker thread and must own everything it
 * captures. On expiry a retryable TIMEOUT fault is returned, the token
 * handed to `op` is cancelled and any late result is discarded. Caller
 * cancellation yields a terminal REQUEST_CANCELLED fault. A non-positive
 * `timeout_ms` waits without a time limit.
 */
RecognizeOutcome with_timeout(const RecognizeOperation& op, int64_t timeout_ms,
                              const CancellationToken& cancel);

/**
 * @brief Run `op` up to max_retries + 1 times with exponential backoff
 *
 * Terminal faults return immediately. Exceptions from `op` count as
 * retryable unknown faults; an unknown fault left after the last attempt is
 * reported as API_CONNECTION_FAILED. Backoff waits end early on
 * cancellation.
 *
 * @param trace Attempt count and delays (optional output)
 */
RecognizeOutcome with_retry(const RecognizeOperation& op, const RetryConfig& config,
                            const CancellationToken& cancel, RetryTrace* trace = nullptr);

} // namespace platerec
