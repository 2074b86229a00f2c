#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "clock.hpp"
#include "errors.hpp"

namespace platerec {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

const char* log_level_name(LogLevel level);

/**
 * @brief Parse "debug", "info", "warn" or "error" (case-insensitive)
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * Recognition mode of a request
 */
enum class RecognitionMode {
    SINGLE_SHOT,   // Every success is surfaced
    REALTIME       // Repeated plates are suppressed
};

const char* recognition_mode_name(RecognitionMode mode);

struct LogConfig {
    bool log_to_console = true;
    LogLevel level = LogLevel::INFO;
    size_t max_entries = 10000;    // Audit trail bound
};

/**
 * One audited request. Only the image hash identifies the frame; pixels
 * and failed plate text are never recorded.
 */
struct RecognitionLogEntry {
    uint64_t id;
    int64_t timestamp_ms;
    std::string image_hash;
    bool success;
    double processing_ms;
    ErrorCode error_code;     // Failures only
    int confidence;           // Successes only
    RecognitionMode mode;
    bool from_cache;
    bool suppressed;

    RecognitionLogEntry()
        : id(0), timestamp_ms(0), success(false), processing_ms(0.0),
          error_code(ErrorCode::API_CONNECTION_FAILED), confidence(0),
          mode(RecognitionMode::SINGLE_SHOT), from_cache(false), suppressed(false) {}
};

struct RecognitionLogStats {
    uint64_t total_requests;
    uint64_t success_count;
    uint64_t failure_count;
    double success_rate;            // Percent
    double average_processing_ms;
    std::map<std::string, uint64_t> error_counts;

    RecognitionLogStats()
        : total_requests(0), success_count(0), failure_count(0),
          success_rate(0.0), average_processing_ms(0.0) {}

    std::string to_json() const;
};

/**
 * @brief Console logger and bounded in-memory audit trail
 *
 * Lines are written to stdout (DEBUG/INFO) or stderr (WARN/ERROR) under a
 * mutex so concurrent requests do not interleave within a line.
 */
class RecognitionLog {
public:
    explicit RecognitionLog(const LogConfig& config = LogConfig(), const Clock* clock = nullptr);

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) { log(LogLevel::DEBUG, component, message); }
    void info(const std::string& component, const std::string& message) { log(LogLevel::INFO, component, message); }
    void warn(const std::string& component, const std::string& message) { log(LogLevel::WARN, component, message); }
    void error(const std::string& component, const std::string& message) { log(LogLevel::ERROR, component, message); }

    RecognitionLogEntry record_success(const std::string& image_hash, double processing_ms,
                                       int confidence, RecognitionMode mode,
                                       bool from_cache, bool suppressed);

    RecognitionLogEntry record_failure(const std::string& image_hash, double processing_ms,
                                       const RecognitionError& error, RecognitionMode mode);

    /**
     * @brief Aggregate over entries recorded at or after `since_ms`
     */
    RecognitionLogStats statistics(int64_t since_ms = 0) const;

    std::vector<RecognitionLogEntry> recent(size_t count = 100) const;

    std::vector<RecognitionLogEntry> by_error_code(ErrorCode code, size_t count = 100) const;

    size_t entry_count() const;

    void clear();

    const LogConfig& config() const { return config_; }

private:
    LogConfig config_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::deque<RecognitionLogEntry> entries_;
    uint64_t next_id_;

    void append_locked(RecognitionLogEntry& entry);
    void write_line_locked(LogLevel level, const std::string& component, const std::string& message);
};

} // namespace platerec
