#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include "clock.hpp"
#include "plate.hpp"

namespace platerec {

/**
 * Recognition cache configuration
 */
struct CacheConfig {
    int64_t ttl_ms = 5 * 60 * 1000;   // Entry lifetime
    size_t max_entries = 1000;
};

/**
 * Cache counters
 */
struct CacheStats {
    uint64_t hits;
    uint64_t misses;
    size_t size;
    double hit_rate;   // 0..1

    CacheStats() : hits(0), misses(0), size(0), hit_rate(0.0) {}
};

/**
 * @brief SHA-256 of the frame dimensions and decoded pixel bytes as lowercase hex
 *
 * Hashing decoded pixels means two encodings of the same frame share a key.
 */
std::string compute_image_hash(const CapturedImage& image);

std::string compute_sha256_hex(const uint8_t* data, size_t size);

/**
 * @brief Content-addressed TTL cache of recognition results
 *
 * Overflow evicts the oldest entry by insertion (FIFO), not by last access,
 * so eviction order is independent of read traffic. All methods are
 * internally synchronized.
 */
class RecognitionCache {
public:
    /**
     * @param config TTL and capacity
     * @param clock Time source; the steady clock when null (not owned)
     */
    explicit RecognitionCache(const CacheConfig& config = CacheConfig(),
                              const Clock* clock = nullptr);

    /**
     * @brief Look up a result
     * @param key Image hash
     * @param result Cached result (output, untouched on miss)
     * @return false if absent or expired; expired entries are evicted
     */
    bool get(const std::string& key, PlateResult& result);

    /**
     * @brief Insert or replace a result with a fresh expiry
     */
    void set(const std::string& key, const PlateResult& result);

    bool remove(const std::string& key);

    // Drops all entries and resets hit/miss counters
    void clear();

    // True if a live entry exists; does not touch the counters
    bool contains(const std::string& key) const;

    /**
     * @brief Evict every expired entry
     * @return Number of entries removed
     */
    size_t cleanup();

    CacheStats stats() const;

    size_t size() const;

    const CacheConfig& config() const { return config_; }

private:
    struct CacheEntry {
        std::string key;
        PlateResult result;
        int64_t created_at_ms;
        int64_t expires_at_ms;
    };

    typedef std::list<CacheEntry> EntryList;

    CacheConfig config_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    EntryList entries_;   // Oldest first
    std::unordered_map<std::string, EntryList::iterator> index_;
    uint64_t hits_;
    uint64_t misses_;

    void erase_locked(std::unordered_map<std::string, EntryList::iterator>::iterator it);
};

} // namespace platerec
