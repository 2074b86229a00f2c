#include "retry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace platerec;

namespace {

RetryConfig fast_retry(uint32_t max_retries)
{
    RetryConfig config;
    config.max_retries = max_retries;
    config.initial_delay_ms = 1;
    config.max_delay_ms = 5;
    config.backoff_multiplier = 2.0;
    return config;
}

RecognizeOutcome plate_outcome()
{
    RecognizerResponse response;
    response.has_plate = true;
    response.plate = platerec_test::make_plate();
    response.confidence = response.plate.confidence;
    return RecognizeOutcome::success(response);
}

// Fails with `kind` for the first `failures` calls, then succeeds
RecognizeOperation failing_then_ok(std::shared_ptr<std::atomic<int>> calls, int failures,
                                   RecognizerFaultKind kind, bool retryable)
{
    return [calls, failures, kind, retryable](const CancellationToken&) {
        const int n = ++(*calls);
        if (n <= failures) {
            return RecognizeOutcome::failure(kind, "failure", retryable);
        }
        return plate_outcome();
    };
}

int64_t elapsed_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

bool test_backoff_schedule()
{
    RetryConfig config;   // 1000 ms doubling, capped at 5000 ms
    CHECK_EQ(compute_backoff_delay(config, 0), 1000);
    CHECK_EQ(compute_backoff_delay(config, 1), 2000);
    CHECK_EQ(compute_backoff_delay(config, 2), 4000);
    CHECK_EQ(compute_backoff_delay(config, 3), 5000);
    CHECK_EQ(compute_backoff_delay(config, 40), 5000);
    return true;
}

bool test_retry_bound()
{
    for (uint32_t max_retries = 0; max_retries <= 4; ++max_retries) {
        auto calls = std::make_shared<std::atomic<int>>(0);
        RetryTrace trace;

        const RecognizeOutcome outcome = with_retry(
            failing_then_ok(calls, 1000, RecognizerFaultKind::API_CONNECTION_FAILED, true),
            fast_retry(max_retries), CancellationToken(), &trace);

        CHECK(!outcome.ok);
        CHECK(outcome.fault.kind == RecognizerFaultKind::API_CONNECTION_FAILED);
        CHECK_EQ(calls->load(), static_cast<int>(max_retries + 1));
        CHECK_EQ(trace.attempts, max_retries + 1);
        CHECK_EQ(trace.delays_ms.size(), static_cast<size_t>(max_retries));
    }
    return true;
}

bool test_early_success_stops()
{
    for (int k = 0; k <= 3; ++k) {
        auto calls = std::make_shared<std::atomic<int>>(0);
        const RecognizeOutcome outcome = with_retry(
            failing_then_ok(calls, k, RecognizerFaultKind::TIMEOUT, true),
            fast_retry(3), CancellationToken());

        CHECK(outcome.ok);
        CHECK(outcome.response.has_plate);
        CHECK_EQ(calls->load(), k + 1);
    }
    return true;
}

bool test_terminal_fault_aborts()
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    const RecognizeOutcome outcome = with_retry(
        failing_then_ok(calls, 10, RecognizerFaultKind::PARSE_ERROR, false),
        fast_retry(3), CancellationToken());

    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::PARSE_ERROR);
    CHECK_EQ(calls->load(), 1);
    return true;
}

bool test_delays_follow_backoff()
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    RetryConfig config = fast_retry(4);
    config.max_delay_ms = 6;
    RetryTrace trace;

    with_retry(failing_then_ok(calls, 100, RecognizerFaultKind::TIMEOUT, true),
               config, CancellationToken(), &trace);

    CHECK_EQ(trace.delays_ms.size(), 4u);
    CHECK_EQ(trace.delays_ms[0], 1);
    CHECK_EQ(trace.delays_ms[1], 2);
    CHECK_EQ(trace.delays_ms[2], 4);
    CHECK_EQ(trace.delays_ms[3], 6);
    return true;
}

bool test_exceptions_become_connection_failure()
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    const RecognizeOperation throwing = [calls](const CancellationToken&) -> RecognizeOutcome {
        ++(*calls);
        throw std::runtime_error("socket closed");
    };

    const RecognizeOutcome outcome = with_retry(throwing, fast_retry(2), CancellationToken());
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::API_CONNECTION_FAILED);
    CHECK(!outcome.fault.retryable);
    CHECK_EQ(outcome.fault.message, std::string("socket closed"));
    CHECK_EQ(calls->load(), 3);
    return true;
}

bool test_non_standard_exceptions_are_retried()
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    const RecognizeOperation throwing = [calls](const CancellationToken&) -> RecognizeOutcome {
        ++(*calls);
        throw 42;
    };

    const RecognizeOutcome outcome = with_retry(throwing, fast_retry(1), CancellationToken());
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::API_CONNECTION_FAILED);
    CHECK(!outcome.fault.message.empty());
    CHECK_EQ(calls->load(), 2);
    return true;
}

bool test_timeout_returns_result_in_time()
{
    const RecognizeOperation quick = [](const CancellationToken&) { return plate_outcome(); };
    const RecognizeOutcome outcome = with_timeout(quick, 1000, CancellationToken());
    CHECK(outcome.ok);
    CHECK_EQ(outcome.response.plate.serial, std::string("1234"));
    return true;
}

bool test_timeout_expires_and_cancels_attempt()
{
    auto attempt_cancelled = std::make_shared<std::atomic<bool>>(false);
    const RecognizeOperation slow = [attempt_cancelled](const CancellationToken& token) {
        if (token.wait_for(2000)) {
            *attempt_cancelled = true;
        }
        return plate_outcome();
    };

    const auto start = std::chrono::steady_clock::now();
    const RecognizeOutcome outcome = with_timeout(slow, 50, CancellationToken());
    CHECK(elapsed_since(start) < 1500);
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::TIMEOUT);
    CHECK(outcome.fault.retryable);

    // The abandoned attempt sees its token fire
    for (int i = 0; i < 100 && !attempt_cancelled->load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(attempt_cancelled->load());
    return true;
}

bool test_timeout_honours_caller_cancel()
{
    CancellationToken cancel;
    const RecognizeOperation slow = [](const CancellationToken& token) {
        token.wait_for(2000);
        return plate_outcome();
    };

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const RecognizeOutcome outcome = with_timeout(slow, 5000, cancel);
    canceller.join();

    CHECK(elapsed_since(start) < 1500);
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::REQUEST_CANCELLED);
    CHECK(!outcome.fault.retryable);

    // Already cancelled: the operation never runs
    auto calls = std::make_shared<std::atomic<int>>(0);
    const RecognizeOutcome again = with_timeout(
        failing_then_ok(calls, 0, RecognizerFaultKind::UNKNOWN, true), 1000, cancel);
    CHECK(again.fault.kind == RecognizerFaultKind::REQUEST_CANCELLED);
    CHECK_EQ(calls->load(), 0);
    return true;
}

bool test_timeout_converts_exceptions()
{
    const RecognizeOperation throwing = [](const CancellationToken&) -> RecognizeOutcome {
        throw std::runtime_error("bad gateway");
    };

    const RecognizeOutcome outcome = with_timeout(throwing, 1000, CancellationToken());
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::UNKNOWN);
    CHECK(outcome.fault.retryable);
    return true;
}

bool test_backoff_wait_is_cancellable()
{
    RetryConfig config;
    config.max_retries = 3;
    config.initial_delay_ms = 5000;
    config.max_delay_ms = 5000;

    CancellationToken cancel;
    auto calls = std::make_shared<std::atomic<int>>(0);

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    const RecognizeOutcome outcome = with_retry(
        failing_then_ok(calls, 10, RecognizerFaultKind::API_CONNECTION_FAILED, true),
        config, cancel);
    canceller.join();

    CHECK(elapsed_since(start) < 2000);
    CHECK(outcome.fault.kind == RecognizerFaultKind::REQUEST_CANCELLED);
    CHECK_EQ(calls->load(), 1);
    return true;
}

bool test_attempt_timeouts_are_retried()
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    const RecognizeOperation slow = [calls](const CancellationToken& token) {
        ++(*calls);
        token.wait_for(2000);
        return plate_outcome();
    };

    const RecognizeOperation bounded = [slow](const CancellationToken& token) {
        return with_timeout(slow, 20, token);
    };

    const RecognizeOutcome outcome = with_retry(bounded, fast_retry(2), CancellationToken());
    CHECK(!outcome.ok);
    CHECK(outcome.fault.kind == RecognizerFaultKind::TIMEOUT);

    // Workers are detached; give the last one a moment to be scheduled
    for (int i = 0; i < 100 && calls->load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK_EQ(calls->load(), 3);
    return true;
}

} // anonymous namespace

int main()
{
    return platerec_test::run_tests("retry orchestrator", {
        {"backoff schedule", test_backoff_schedule},
        {"retry bound", test_retry_bound},
        {"early success stops", test_early_success_stops},
        {"terminal fault aborts", test_terminal_fault_aborts},
        {"delays follow backoff", test_delays_follow_backoff},
        {"exceptions become connection failure", test_exceptions_become_connection_failure},
        {"non standard exceptions are retried", test_non_standard_exceptions_are_retried},
        {"timeout returns result in time", test_timeout_returns_result_in_time},
        {"timeout expires and cancels attempt", test_timeout_expires_and_cancels_attempt},
        {"timeout honours caller cancel", test_timeout_honours_caller_cancel},
        {"timeout converts exceptions", test_timeout_converts_exceptions},
        {"backoff wait is cancellable", test_backoff_wait_is_cancellable},
        {"attempt timeouts are retried", test_attempt_timeouts_are_retried},
    });
}
