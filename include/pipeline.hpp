#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include "cache.hpp"
#include "cancellation.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plate.hpp"
#include "quality.hpp"
#include "rate_limiter.hpp"
#include "recognition_log.hpp"
#include "recognizer.hpp"
#include "stats.hpp"
#include "suppressor.hpp"

namespace platerec {

enum class PipelineStatus {
    RECOGNIZED,   // New result for the caller
    SUPPRESSED,   // Realtime duplicate: no new result, not an error
    FAILED
};

const char* pipeline_status_name(PipelineStatus status);

/**
 * Outcome of one recognition request
 */
struct PipelineResult {
    PipelineStatus status;
    PlateResult plate;            // Valid unless FAILED
    RecognitionError error;       // Valid only if FAILED
    bool from_cache;
    std::string image_hash;       // Empty if the image was rejected before hashing
    double processing_time_ms;
    uint32_t occurrence_count;    // Realtime mode only
    ImageQualityMetrics metrics;

    PipelineResult()
        : status(PipelineStatus::FAILED), from_cache(false),
          processing_time_ms(0.0), occurrence_count(0) {}

    bool succeeded() const { return status != PipelineStatus::FAILED; }
};

/**
 * @brief Recognition request pipeline
 *
 * Runs each request through:
 * - Quality gate (no network call for unusable frames)
 * - Recognition cache keyed by image hash
 * - Rate limiter admission (cache misses only)
 * - Recognizer behind per-attempt timeout, retry and request timeout
 * - Duplicate suppression (realtime mode only)
 *
 * Collaborators are shared so several pipelines can use one cache or one
 * limiter. recognize() may be called from multiple threads.
 */
class RecognitionPipeline {
public:
    /**
     * @brief Construct pipeline from explicit components
     * @param config Quality thresholds, retry policy and timeouts are read from here
     * @param clock Time source shared with the components (not owned; steady clock when null)
     */
    RecognitionPipeline(const PipelineConfig& config,
                        std::shared_ptr<Recognizer> recognizer,
                        std::shared_ptr<RecognitionCache> cache,
                        std::shared_ptr<RateLimiter> rate_limiter,
                        std::shared_ptr<DuplicateSuppressor> suppressor,
                        std::shared_ptr<RecognitionLog> log,
                        const Clock* clock = nullptr);

    /**
     * @brief Construct pipeline with fresh components built from configuration
     */
    RecognitionPipeline(const PipelineConfig& config,
                        std::shared_ptr<Recognizer> recognizer,
                        const Clock* clock = nullptr);

    /**
     * @brief Recognize the plate in one frame
     * @param image Captured frame
     * @param mode SINGLE_SHOT surfaces every success; REALTIME suppresses repeats
     * @param cancel Caller cancellation; an unset token never fires
     * @return Tagged result; never throws for recognizer failures
     */
    PipelineResult recognize(const CapturedImage& image,
                             RecognitionMode mode,
                             const CancellationToken& cancel = CancellationToken());

    /**
     * @brief Snapshot of the aggregate statistics
     */
    PipelineStats stats() const;

    /**
     * @brief Print recognition summary statistics
     */
    void print_summary() const;

    /**
     * @brief Write statistics to JSON file
     * @param output_path Path to output JSON file
     * @return true if successful, false otherwise
     */
    bool write_statistics(const std::string& output_path) const;

    const PipelineConfig& config() const { return config_; }

    RecognitionCache& cache() { return *cache_; }
    RateLimiter& rate_limiter() { return *rate_limiter_; }
    DuplicateSuppressor& suppressor() { return *suppressor_; }
    RecognitionLog& log() { return *log_; }

private:
    PipelineConfig config_;
    const Clock& clock_;
    QualityGate gate_;

    std::shared_ptr<Recognizer> recognizer_;
    std::shared_ptr<RecognitionCache> cache_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<DuplicateSuppressor> suppressor_;
    std::shared_ptr<RecognitionLog> log_;

    mutable std::mutex stats_mutex_;
    PipelineStats stats_;

    /**
     * @brief Call the recognizer through the retry orchestrator
     */
    RecognizeOutcome call_recognizer(const CapturedImage& image, const CancellationToken& cancel);

    PipelineResult finish_failure(PipelineResult& result, const RecognitionError& error,
                                  RecognitionMode mode, std::chrono::steady_clock::time_point start);

    PipelineResult finish_success(PipelineResult& result, const PlateResult& plate,
                                  RecognitionMode mode, std::chrono::steady_clock::time_point start);
};

} // namespace platerec
