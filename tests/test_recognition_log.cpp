#include "recognition_log.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace platerec;

namespace {

LogConfig silent_config(size_t max_entries = 10000)
{
    LogConfig config;
    config.log_to_console = false;
    config.max_entries = max_entries;
    return config;
}

bool test_records_and_statistics()
{
    ManualClock clock(1000);
    RecognitionLog log(silent_config(), &clock);

    log.record_success("aaaa", 100.0, 95, RecognitionMode::SINGLE_SHOT, false, false);
    clock.advance(10);
    log.record_success("bbbb", 20.0, 90, RecognitionMode::REALTIME, true, true);
    clock.advance(10);
    log.record_failure("cccc", 60.0, make_recognition_error(ErrorCode::TIMEOUT), RecognitionMode::SINGLE_SHOT);
    log.record_failure("", 20.0, make_recognition_error(ErrorCode::TIMEOUT), RecognitionMode::SINGLE_SHOT);

    const RecognitionLogStats stats = log.statistics();
    CHECK_EQ(stats.total_requests, 4u);
    CHECK_EQ(stats.success_count, 2u);
    CHECK_EQ(stats.failure_count, 2u);
    CHECK(stats.success_rate == 50.0);
    CHECK(stats.average_processing_ms == 50.0);
    CHECK_EQ(stats.error_counts.size(), 1u);
    CHECK_EQ(stats.error_counts.at("TIMEOUT"), 2u);

    // Only entries at or after the cut-off
    const RecognitionLogStats recent = log.statistics(1010);
    CHECK_EQ(recent.total_requests, 3u);
    return true;
}

bool test_entries_carry_audit_fields()
{
    ManualClock clock(500);
    RecognitionLog log(silent_config(), &clock);

    const RecognitionLogEntry ok = log.record_success("hash-1", 12.5, 77, RecognitionMode::REALTIME, true, false);
    CHECK_EQ(ok.id, 1u);
    CHECK_EQ(ok.timestamp_ms, 500);
    CHECK(ok.success);
    CHECK_EQ(ok.confidence, 77);
    CHECK(ok.mode == RecognitionMode::REALTIME);
    CHECK(ok.from_cache);

    const RecognitionLogEntry failed = log.record_failure(
        "hash-2", 3.0, make_recognition_error(ErrorCode::RATE_LIMITED), RecognitionMode::SINGLE_SHOT);
    CHECK_EQ(failed.id, 2u);
    CHECK(!failed.success);
    CHECK(failed.error_code == ErrorCode::RATE_LIMITED);
    CHECK_EQ(failed.image_hash, std::string("hash-2"));

    const std::vector<RecognitionLogEntry> limited = log.by_error_code(ErrorCode::RATE_LIMITED);
    CHECK_EQ(limited.size(), 1u);
    CHECK(log.by_error_code(ErrorCode::TIMEOUT).empty());
    return true;
}

bool test_audit_trail_is_bounded()
{
    RecognitionLog log(silent_config(5));

    for (int i = 0; i < 12; ++i) {
        log.record_success("h" + std::to_string(i), 1.0, 90, RecognitionMode::SINGLE_SHOT, false, false);
    }
    CHECK_EQ(log.entry_count(), 5u);

    const std::vector<RecognitionLogEntry> last = log.recent(2);
    CHECK_EQ(last.size(), 2u);
    CHECK_EQ(last[0].image_hash, std::string("h10"));
    CHECK_EQ(last[1].image_hash, std::string("h11"));
    CHECK_EQ(last[1].id, 12u);

    CHECK_EQ(log.recent(100).size(), 5u);

    log.clear();
    CHECK_EQ(log.entry_count(), 0u);
    CHECK_EQ(log.statistics().total_requests, 0u);
    return true;
}

bool test_json_export()
{
    RecognitionLog log(silent_config());

    const std::string empty = log.statistics().to_json();
    CHECK(empty.find("\"total_requests\": 0") != std::string::npos);
    CHECK(empty.find("\"error_counts\": {}") != std::string::npos);

    log.record_failure("h", 5.0, make_recognition_error(ErrorCode::PLATE_NOT_RECOGNIZED),
                       RecognitionMode::SINGLE_SHOT);
    const std::string json = log.statistics().to_json();
    CHECK(json.find("\"PLATE_NOT_RECOGNIZED\": 1") != std::string::npos);
    CHECK(json.find("\"failure_count\": 1") != std::string::npos);
    return true;
}

bool test_level_names()
{
    LogLevel level = LogLevel::INFO;
    CHECK(parse_log_level("debug", level) && level == LogLevel::DEBUG);
    CHECK(parse_log_level("WARNING", level) && level == LogLevel::WARN);
    CHECK(parse_log_level("Error", level) && level == LogLevel::ERROR);
    CHECK(!parse_log_level("verbose", level));
    CHECK_EQ(std::string(log_level_name(LogLevel::WARN)), std::string("WARN"));
    CHECK_EQ(std::string(recognition_mode_name(RecognitionMode::REALTIME)), std::string("realtime"));
    return true;
}

bool test_concurrent_records()
{
    RecognitionLog log(silent_config());

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&log]() {
            for (int i = 0; i < 250; ++i) {
                log.record_success("h", 1.0, 90, RecognitionMode::REALTIME, false, false);
                log.info("worker", "tick");
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    CHECK_EQ(log.entry_count(), 1000u);
    CHECK_EQ(log.recent(1)[0].id, 1000u);
    return true;
}

} // anonymous namespace

int main()
{
    return platerec_test::run_tests("recognition log", {
        {"records and statistics", test_records_and_statistics},
        {"entries carry audit fields", test_entries_carry_audit_fields},
        {"audit trail is bounded", test_audit_trail_is_bounded},
        {"json export", test_json_export},
        {"level names", test_level_names},
        {"concurrent records", test_concurrent_records},
    });
}
