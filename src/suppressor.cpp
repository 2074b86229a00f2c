/**
 * @file suppressor.cpp
 * @brief LRU-bounded suppression of repeated realtime recognitions
 */

#include "suppressor.hpp"
#include <iterator>

namespace platerec {

DuplicateSuppressor::DuplicateSuppressor(const SuppressionConfig& config)
    : config_(config)
{
}

DuplicateCheck DuplicateSuppressor::check_and_record(const std::string& plate_key, int64_t now_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    DuplicateCheck check;

    auto it = index_.find(plate_key);
    if (it != index_.end()) {
        SuppressionEntry& entry = *it->second;
        const int64_t elapsed = now_ms - entry.last_seen_at_ms;

        if (elapsed < config_.suppression_duration_ms) {
            // Duplicate: history stays as it was
            check.is_duplicate = true;
            check.occurrence_count = entry.occurrence_count;
            check.ms_since_last = elapsed;
            return check;
        }

        // Window elapsed: new occurrence, move to most recently used
        entry.last_seen_at_ms = now_ms;
        entry.occurrence_count++;
        lru_.splice(lru_.end(), lru_, it->second);

        check.occurrence_count = entry.occurrence_count;
        return check;
    }

    while (!lru_.empty() && lru_.size() >= config_.max_history_size) {
        index_.erase(lru_.front().plate_key);
        lru_.pop_front();
    }

    SuppressionEntry entry;
    entry.plate_key = plate_key;
    entry.last_seen_at_ms = now_ms;
    entry.occurrence_count = 1;

    lru_.push_back(entry);
    index_[plate_key] = std::prev(lru_.end());

    check.occurrence_count = 1;
    return check;
}

bool DuplicateSuppressor::is_duplicate(const std::string& plate_key, int64_t now_ms) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(plate_key);
    if (it == index_.end()) {
        return false;
    }
    return now_ms - it->second->last_seen_at_ms < config_.suppression_duration_ms;
}

void DuplicateSuppressor::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

size_t DuplicateSuppressor::cleanup(int64_t now_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    for (auto it = lru_.begin(); it != lru_.end(); ) {
        if (now_ms - it->last_seen_at_ms >= config_.suppression_duration_ms) {
            index_.erase(it->plate_key);
            it = lru_.erase(it);
            removed++;
        }
        else {
            ++it;
        }
    }

    return removed;
}

size_t DuplicateSuppressor::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

std::vector<SuppressionEntry> DuplicateSuppressor::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SuppressionEntry>(lru_.begin(), lru_.end());
}

} // namespace platerec
