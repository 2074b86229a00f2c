#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "errors.hpp"

namespace platerec {

/**
 * Histogram of edge orientations
 * Bins: 0..180 degrees, 5 degrees per bin (bin i centred on i*5)
 */
class AngleHistogram {
public:
    static constexpr int BIN_WIDTH_DEG = 5;
    static constexpr size_t NUM_BINS = 180 / BIN_WIDTH_DEG + 1;

    AngleHistogram();

    // Accumulate one orientation; |angle| is used and clamped to [0, 180]
    void accumulate(double angle_deg);

    // Clear histogram
    void clear();

    const std::vector<uint64_t>& bins() const { return bins_; }

    uint64_t total_samples() const { return total_samples_; }

    /**
     * @brief Centre of the most populated bin in degrees
     *
     * Ties resolve to the lowest angle. Returns 0 for an empty histogram.
     */
    double dominant_angle() const;

private:
    std::vector<uint64_t> bins_;
    uint64_t total_samples_;
};

/**
 * Aggregate statistics for a pipeline instance
 */
struct PipelineStats {
    uint64_t requests;
    uint64_t recognized;          // Results surfaced to the caller
    uint64_t suppressed;          // Realtime duplicates withheld
    uint64_t failures;
    uint64_t cache_hits;
    uint64_t recognizer_calls;    // Admitted calls into the retry orchestrator
    double total_processing_ms;

    std::map<std::string, uint64_t> failures_by_code;

    PipelineStats()
        : requests(0), recognized(0), suppressed(0), failures(0),
          cache_hits(0), recognizer_calls(0), total_processing_ms(0.0) {}

    void add_success(bool from_cache, bool was_suppressed, double processing_ms);

    void add_failure(ErrorCode code, double processing_ms);

    double average_processing_ms() const;

    // Export to JSON string
    std::string to_json() const;
};

} // namespace platerec
