/**
 * @file pipeline.cpp
 * @brief Recognition request pipeline orchestration
 *
 * Manages the complete request workflow:
 * - Reject unusable frames before any network call
 * - Serve repeated frames from the result cache
 * - Admit recognizer calls through the rate limiter
 * - Bound recognizer calls with timeouts and retries
 * - Withhold repeated plates in realtime mode
 */

#include "pipeline.hpp"
#include "retry.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace platerec {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

} // anonymous namespace

const char* pipeline_status_name(PipelineStatus status)
{
    switch (status) {
        case PipelineStatus::RECOGNIZED: return "RECOGNIZED";
        case PipelineStatus::SUPPRESSED: return "SUPPRESSED";
        case PipelineStatus::FAILED:     return "FAILED";
    }
    return "FAILED";
}

RecognitionPipeline::RecognitionPipeline(const PipelineConfig& config,
                                         std::shared_ptr<Recognizer> recognizer,
                                         std::shared_ptr<RecognitionCache> cache,
                                         std::shared_ptr<RateLimiter> rate_limiter,
                                         std::shared_ptr<DuplicateSuppressor> suppressor,
                                         std::shared_ptr<RecognitionLog> log,
                                         const Clock* clock)
    : config_(config)
    , clock_(clock ? *clock : Clock::steady())
    , gate_(config.quality)
    , recognizer_(std::move(recognizer))
    , cache_(std::move(cache))
    , rate_limiter_(std::move(rate_limiter))
    , suppressor_(std::move(suppressor))
    , log_(std::move(log))
{
    if (!recognizer_ || !cache_ || !rate_limiter_ || !suppressor_ || !log_) {
        throw std::invalid_argument("RecognitionPipeline requires every component");
    }
}

RecognitionPipeline::RecognitionPipeline(const PipelineConfig& config,
                                         std::shared_ptr<Recognizer> recognizer,
                                         const Clock* clock)
    : RecognitionPipeline(config,
                          std::move(recognizer),
                          std::make_shared<RecognitionCache>(config.cache, clock),
                          std::make_shared<RateLimiter>(config.rate_limit, clock),
                          std::make_shared<DuplicateSuppressor>(config.suppression),
                          std::make_shared<RecognitionLog>(config.logging, clock),
                          clock)
{
}

PipelineResult RecognitionPipeline::recognize(const CapturedImage& image,
                                              RecognitionMode mode,
                                              const CancellationToken& cancel)
{
    const auto start = std::chrono::steady_clock::now();
    PipelineResult result;

    if (cancel.is_cancelled()) {
        return finish_failure(result, make_recognition_error(ErrorCode::REQUEST_CANCELLED), mode, start);
    }

    if (!image.is_valid()) {
        return finish_failure(result, make_recognition_error(ErrorCode::INVALID_IMAGE), mode, start);
    }

    // Stage 1: quality gate
    const std::vector<ValidationError> validation = gate_.evaluate(image, result.metrics);
    if (!validation.empty()) {
        return finish_failure(result, make_invalid_image_error(validation), mode, start);
    }

    // Stage 2: cache lookup
    try {
        result.image_hash = compute_image_hash(image);
    }
    catch (const std::runtime_error& e) {
        RecognitionError error = make_recognition_error(ErrorCode::INVALID_IMAGE);
        error.message = e.what();
        return finish_failure(result, error, mode, start);
    }

    PlateResult plate;
    if (cache_->get(result.image_hash, plate)) {
        result.from_cache = true;
        return finish_success(result, plate, mode, start);
    }

    // Stage 3: admission and recognition
    RecognizeOutcome outcome;
    {
        RateLimitSlot slot(*rate_limiter_);
        if (!slot.acquired()) {
            return finish_failure(result, make_recognition_error(ErrorCode::RATE_LIMITED), mode, start);
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.recognizer_calls++;
        }

        outcome = call_recognizer(image, cancel);
    }

    if (!outcome.ok) {
        log_->warn("recognizer", std::string(recognizer_fault_name(outcome.fault.kind))
                                 + (outcome.fault.retryable ? " (retryable): " : ": ")
                                 + outcome.fault.message);
        return finish_failure(result, error_from_fault(outcome.fault), mode, start);
    }

    if (!outcome.response.has_plate) {
        return finish_failure(result, make_recognition_error(ErrorCode::PLATE_NOT_RECOGNIZED), mode, start);
    }

    cache_->set(result.image_hash, outcome.response.plate);

    return finish_success(result, outcome.response.plate, mode, start);
}

RecognizeOutcome RecognitionPipeline::call_recognizer(const CapturedImage& image,
                                                      const CancellationToken& cancel)
{
    // Everything the worker threads touch is captured by value
    std::shared_ptr<Recognizer> recognizer = recognizer_;
    const CapturedImage frame = image;
    const RetryConfig retry = config_.retry;
    const int64_t attempt_timeout_ms = config_.recognition_timeout_ms;

    const RecognizeOperation attempt = [recognizer, frame](const CancellationToken& token) {
        return recognizer->recognize(frame, token);
    };

    const RecognizeOperation bounded_attempt = [attempt, attempt_timeout_ms](const CancellationToken& token) {
        return with_timeout(attempt, attempt_timeout_ms, token);
    };

    const RecognizeOperation sequence = [bounded_attempt, retry](const CancellationToken& token) {
        return with_retry(bounded_attempt, retry, token);
    };

    return with_timeout(sequence, config_.request_timeout_ms, cancel);
}

PipelineResult RecognitionPipeline::finish_failure(PipelineResult& result, const RecognitionError& error,
                                                   RecognitionMode mode,
                                                   std::chrono::steady_clock::time_point start)
{
    result.status = PipelineStatus::FAILED;
    result.error = error;
    result.processing_time_ms = elapsed_ms(start);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.add_failure(error.code, result.processing_time_ms);
    }

    log_->record_failure(result.image_hash, result.processing_time_ms, error, mode);
    return result;
}

PipelineResult RecognitionPipeline::finish_success(PipelineResult& result, const PlateResult& plate,
                                                   RecognitionMode mode,
                                                   std::chrono::steady_clock::time_point start)
{
    result.plate = plate;
    result.status = PipelineStatus::RECOGNIZED;

    // Stage 4: realtime duplicate suppression
    if (mode == RecognitionMode::REALTIME) {
        const DuplicateCheck check = suppressor_->check_and_record(plate.full_text, clock_.now_ms());
        result.occurrence_count = check.occurrence_count;
        if (check.is_duplicate) {
            result.status = PipelineStatus::SUPPRESSED;
        }
    }

    result.processing_time_ms = elapsed_ms(start);
    const bool suppressed = (result.status == PipelineStatus::SUPPRESSED);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.add_success(result.from_cache, suppressed, result.processing_time_ms);
    }

    log_->record_success(result.image_hash, result.processing_time_ms, plate.confidence,
                         mode, result.from_cache, suppressed);
    return result;
}

PipelineStats RecognitionPipeline::stats() const
{
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void RecognitionPipeline::print_summary() const
{
    const PipelineStats snapshot = stats();
    const CacheStats cache_stats = cache_->stats();

    std::cout << std::endl;
    std::cout << "=== Recognition Summary ===" << std::endl;
    std::cout << "Requests: " << snapshot.requests << std::endl;
    std::cout << "Recognized: " << snapshot.recognized << std::endl;
    std::cout << "Suppressed duplicates: " << snapshot.suppressed << std::endl;
    std::cout << "Failures: " << snapshot.failures << std::endl;

    for (const auto& entry : snapshot.failures_by_code) {
        std::cout << "  " << entry.first << ": " << entry.second << std::endl;
    }

    std::cout << "Recognizer calls: " << snapshot.recognizer_calls << std::endl;
    std::cout << "Cache hit rate: " << std::fixed << std::setprecision(1)
              << (cache_stats.hit_rate * 100.0) << "% (" << cache_stats.hits << " hits, "
              << cache_stats.misses << " misses)" << std::endl;
    std::cout << "Average processing time: " << std::fixed << std::setprecision(2)
              << snapshot.average_processing_ms() << " ms/request" << std::endl;
}

bool RecognitionPipeline::write_statistics(const std::string& output_path) const
{
    std::ofstream ofs(output_path);
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << output_path << std::endl;
        return false;
    }

    const CacheStats cache_stats = cache_->stats();
    const RateLimitStats limiter_stats = rate_limiter_->stats();

    ofs << "{\n";
    ofs << "  \"pipeline\": " << stats().to_json() << ",\n";
    ofs << "  \"log\": " << log_->statistics().to_json() << ",\n";
    ofs << "  \"cache\": {\n";
    ofs << "    \"hits\": " << cache_stats.hits << ",\n";
    ofs << "    \"misses\": " << cache_stats.misses << ",\n";
    ofs << "    \"size\": " << cache_stats.size << ",\n";
    ofs << "    \"hit_rate\": " << cache_stats.hit_rate << "\n";
    ofs << "  },\n";
    ofs << "  \"rate_limit\": {\n";
    ofs << "    \"current_concurrent\": " << limiter_stats.current_concurrent << ",\n";
    ofs << "    \"requests_in_window\": " << limiter_stats.requests_in_window << ",\n";
    ofs << "    \"max_concurrent\": " << limiter_stats.max_concurrent << ",\n";
    ofs << "    \"max_requests\": " << limiter_stats.max_requests << "\n";
    ofs << "  },\n";
    ofs << "  \"suppression\": {\n";
    ofs << "    \"tracked_plates\": " << suppressor_->size() << "\n";
    ofs << "  }\n";
    ofs << "}\n";

    if (!ofs) {
        std::cerr << "Failed to write statistics to " << output_path << std::endl;
        return false;
    }

    std::cout << "Statistics written to " << output_path << std::endl;
    return true;
}

} // namespace platerec
