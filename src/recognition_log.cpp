/**
 * @file recognition_log.cpp
 * @brief Console logging and the recognition audit trail
 *
 * Failures are logged with the image hash so they can be audited without
 * keeping the frame or the plate text.
 */

#include "recognition_log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace platerec {

namespace {

std::string wall_clock_timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
    gmtime_r(&seconds, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%T", &utc);

    std::ostringstream oss;
    oss << buf << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// Hashes are long; the first 12 hex digits are enough to correlate lines
std::string short_hash(const std::string& hash)
{
    return hash.size() > 12 ? hash.substr(0, 12) : hash;
}

} // anonymous namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& level)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") { level = LogLevel::DEBUG; return true; }
    if (lower == "info")  { level = LogLevel::INFO; return true; }
    if (lower == "warn" || lower == "warning") { level = LogLevel::WARN; return true; }
    if (lower == "error") { level = LogLevel::ERROR; return true; }
    return false;
}

const char* recognition_mode_name(RecognitionMode mode)
{
    return mode == RecognitionMode::REALTIME ? "realtime" : "single";
}

std::string RecognitionLogStats::to_json() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "{\n";
    oss << "  \"total_requests\": " << total_requests << ",\n";
    oss << "  \"success_count\": " << success_count << ",\n";
    oss << "  \"failure_count\": " << failure_count << ",\n";
    oss << "  \"success_rate\": " << success_rate << ",\n";
    oss << "  \"average_processing_ms\": " << average_processing_ms << ",\n";
    oss << "  \"error_counts\": {";

    bool first = true;
    for (const auto& entry : error_counts) {
        oss << (first ? "\n" : ",\n");
        oss << "    \"" << entry.first << "\": " << entry.second;
        first = false;
    }
    oss << (first ? "}\n" : "\n  }\n");
    oss << "}";

    return oss.str();
}

RecognitionLog::RecognitionLog(const LogConfig& config, const Clock* clock)
    : config_(config)
    , clock_(clock ? *clock : Clock::steady())
    , next_id_(1)
{
}

void RecognitionLog::log(LogLevel level, const std::string& component, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    write_line_locked(level, component, message);
}

RecognitionLogEntry RecognitionLog::record_success(const std::string& image_hash, double processing_ms,
                                                   int confidence, RecognitionMode mode,
                                                   bool from_cache, bool suppressed)
{
    RecognitionLogEntry entry;
    entry.image_hash = image_hash;
    entry.success = true;
    entry.processing_ms = processing_ms;
    entry.confidence = confidence;
    entry.mode = mode;
    entry.from_cache = from_cache;
    entry.suppressed = suppressed;

    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(entry);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "id=" << entry.id
        << " hash=" << short_hash(image_hash)
        << " mode=" << recognition_mode_name(mode)
        << " time=" << processing_ms << "ms"
        << " confidence=" << confidence << "%"
        << (from_cache ? " cache=hit" : "")
        << (suppressed ? " suppressed" : "");
    write_line_locked(LogLevel::INFO, "pipeline", oss.str());

    return entry;
}

RecognitionLogEntry RecognitionLog::record_failure(const std::string& image_hash, double processing_ms,
                                                   const RecognitionError& error, RecognitionMode mode)
{
    RecognitionLogEntry entry;
    entry.image_hash = image_hash;
    entry.success = false;
    entry.processing_ms = processing_ms;
    entry.error_code = error.code;
    entry.mode = mode;

    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(entry);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "id=" << entry.id
        << " hash=" << (image_hash.empty() ? std::string("-") : short_hash(image_hash))
        << " mode=" << recognition_mode_name(mode)
        << " time=" << processing_ms << "ms"
        << " code=" << error_code_name(error.code)
        << " message=\"" << error.message << "\"";
    write_line_locked(LogLevel::ERROR, "pipeline", oss.str());

    return entry;
}

RecognitionLogStats RecognitionLog::statistics(int64_t since_ms) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    RecognitionLogStats stats;
    double total_ms = 0.0;

    for (const auto& entry : entries_) {
        if (entry.timestamp_ms < since_ms) {
            continue;
        }

        stats.total_requests++;
        total_ms += entry.processing_ms;

        if (entry.success) {
            stats.success_count++;
        } else {
            stats.failure_count++;
            stats.error_counts[error_code_name(entry.error_code)]++;
        }
    }

    if (stats.total_requests > 0) {
        stats.success_rate = 100.0 * stats.success_count / stats.total_requests;
        stats.average_processing_ms = total_ms / stats.total_requests;
    }

    return stats;
}

std::vector<RecognitionLogEntry> RecognitionLog::recent(size_t count) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(count, entries_.size());
    return std::vector<RecognitionLogEntry>(entries_.end() - n, entries_.end());
}

std::vector<RecognitionLogEntry> RecognitionLog::by_error_code(ErrorCode code, size_t count) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecognitionLogEntry> matches;

    for (const auto& entry : entries_) {
        if (!entry.success && entry.error_code == code) {
            matches.push_back(entry);
        }
    }

    if (matches.size() > count) {
        matches.erase(matches.begin(), matches.end() - count);
    }
    return matches;
}

size_t RecognitionLog::entry_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void RecognitionLog::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void RecognitionLog::append_locked(RecognitionLogEntry& entry)
{
    entry.id = next_id_++;
    entry.timestamp_ms = clock_.now_ms();

    entries_.push_back(entry);
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

void RecognitionLog::write_line_locked(LogLevel level, const std::string& component,
                                       const std::string& message)
{
    if (!config_.log_to_console || level < config_.level) {
        return;
    }

    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << wall_clock_timestamp()
        << " [platerec][" << log_level_name(level) << "][" << component << "] "
        << message << std::endl;
}

} // namespace platerec
