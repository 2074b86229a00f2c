#include "stats.hpp"
#include <cmath>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace platerec {

// ============================================================================
// AngleHistogram
// ============================================================================

AngleHistogram::AngleHistogram()
    : bins_(NUM_BINS, 0), total_samples_(0)
{
}

void AngleHistogram::accumulate(double angle_deg) {
    double a = std::min(std::fabs(angle_deg), 180.0);

    // Round to the nearest bin centre
    long bin = std::lround(a / BIN_WIDTH_DEG);
    if (bin >= static_cast<long>(NUM_BINS)) {
        bin = static_cast<long>(NUM_BINS) - 1;
    }

    bins_[static_cast<size_t>(bin)]++;
    total_samples_++;
}

void AngleHistogram::clear() {
    std::fill(bins_.begin(), bins_.end(), 0);
    total_samples_ = 0;
}

double AngleHistogram::dominant_angle() const {
    uint64_t max_count = 0;
    size_t dominant = 0;

    for (size_t i = 0; i < NUM_BINS; ++i) {
        if (bins_[i] > max_count) {
            max_count = bins_[i];
            dominant = i;
        }
    }

    return static_cast<double>(dominant * BIN_WIDTH_DEG);
}

// ============================================================================
// PipelineStats
// ============================================================================

void PipelineStats::add_success(bool from_cache, bool was_suppressed, double processing_ms) {
    requests++;

    if (from_cache) {
        cache_hits++;
    }

    if (was_suppressed) {
        suppressed++;
    } else {
        recognized++;
    }

    total_processing_ms += processing_ms;
}

void PipelineStats::add_failure(ErrorCode code, double processing_ms) {
    requests++;
    failures++;
    failures_by_code[error_code_name(code)]++;
    total_processing_ms += processing_ms;
}

double PipelineStats::average_processing_ms() const {
    if (requests == 0) return 0.0;
    return total_processing_ms / requests;
}

std::string PipelineStats::to_json() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    const double success_rate = requests > 0
        ? static_cast<double>(recognized + suppressed) / requests
        : 0.0;

    oss << "{\n";
    oss << "  \"requests\": " << requests << ",\n";
    oss << "  \"recognized\": " << recognized << ",\n";
    oss << "  \"suppressed\": " << suppressed << ",\n";
    oss << "  \"failures\": " << failures << ",\n";
    oss << "  \"cache_hits\": " << cache_hits << ",\n";
    oss << "  \"recognizer_calls\": " << recognizer_calls << ",\n";
    oss << "  \"success_rate\": " << success_rate << ",\n";
    oss << "  \"avg_processing_time_ms\": " << average_processing_ms() << ",\n";
    oss << "  \"failures_by_code\": {";

    bool first = true;
    for (const auto& entry : failures_by_code) {
        oss << (first ? "\n" : ",\n");
        oss << "    \"" << entry.first << "\": " << entry.second;
        first = false;
    }
    oss << (first ? "}\n" : "\n  }\n");
    oss << "}";

    return oss.str();
}

} // namespace platerec
