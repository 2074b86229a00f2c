#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace platerec {

struct SuppressionConfig {
    int64_t suppression_duration_ms = 5000;
    size_t max_history_size = 100;
};

/**
 * Result of a duplicate check
 */
struct DuplicateCheck {
    bool is_duplicate;
    uint32_t occurrence_count;
    int64_t ms_since_last;     // Only meaningful for duplicates

    DuplicateCheck() : is_duplicate(false), occurrence_count(0), ms_since_last(0) {}
};

/**
 * History entry, exposed through snapshot() for diagnostics
 */
struct SuppressionEntry {
    std::string plate_key;
    int64_t last_seen_at_ms;
    uint32_t occurrence_count;
};

/**
 * @brief Time-windowed suppressor for repeated realtime recognitions
 *
 * Keyed by plate full text. History is bounded and evicts the least recently
 * used key. A duplicate sighting does not refresh its entry. All methods are
 * internally synchronized.
 */
class DuplicateSuppressor {
public:
    explicit DuplicateSuppressor(const SuppressionConfig& config = SuppressionConfig());

    /**
     * @brief Classify a sighting and record it
     * @param plate_key Plate full text
     * @param now_ms Observation time
     */
    DuplicateCheck check_and_record(const std::string& plate_key, int64_t now_ms);

    /**
     * @brief Read-only duplicate test; history is not modified
     */
    bool is_duplicate(const std::string& plate_key, int64_t now_ms) const;

    void clear();

    /**
     * @brief Drop entries whose suppression window has elapsed
     * @return Number of entries evicted
     */
    size_t cleanup(int64_t now_ms);

    size_t size() const;

    // Entries from least to most recently used
    std::vector<SuppressionEntry> snapshot() const;

    const SuppressionConfig& config() const { return config_; }

private:
    typedef std::list<SuppressionEntry> EntryList;

    SuppressionConfig config_;

    mutable std::mutex mutex_;
    EntryList lru_;   // Least recently used first
    std::unordered_map<std::string, EntryList::iterator> index_;
};

} // namespace platerec
