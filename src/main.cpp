/**
 * @file main.cpp
 * @brief Command-line interface for the plate recognition pipeline
 *
 * Runs PNG frames through the recognition pipeline, replaying a stored
 * vision model reply in place of the remote recognizer.
 *
 * Usage:
 *   platerec --image plate.png --reply reply.json
 *   platerec --image a.png --image b.png --reply reply.json --mode realtime --interval-ms 500
 */

#include "pipeline.hpp"
#include "config.hpp"
#include "image_io.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <csignal>
#include <atomic>
#include <memory>
#include <chrono>
#include <thread>

namespace {

std::atomic<bool> g_interrupted(false);

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

struct CommandLine {
    std::vector<std::string> images;
    std::string reply_file;
    std::string config_file;
    std::string profile;
    std::string stats_file;
    platerec::RecognitionMode mode = platerec::RecognitionMode::SINGLE_SHOT;
    int64_t interval_ms = 0;
    bool quiet = false;
};

void print_usage(const char* program_name)
{
    std::cout << "License Plate Recognition Pipeline" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " --image <png> [--image <png> ...] --reply <file> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --image <path>         PNG frame to recognize (repeatable)" << std::endl;
    std::cout << "  --reply <path>         Stored vision model reply used as recognizer output" << std::endl;
    std::cout << "  --mode <single|realtime>  Recognition mode (default: single)" << std::endl;
    std::cout << "  --config <path>        Load configuration from YAML file" << std::endl;
    std::cout << "  --profile <name>       Use specific profile from config file" << std::endl;
    std::cout << "  --stats <path>         Write statistics JSON to this file" << std::endl;
    std::cout << "  --interval-ms <N>      Pause between frames in milliseconds" << std::endl;
    std::cout << "  --quiet                Disable console request logging" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " --image plate.png --reply reply.json" << std::endl;
    std::cout << "  " << program_name << " --config config.yaml --profile realtime --mode realtime \\" << std::endl;
    std::cout << "      --image f1.png --image f2.png --reply reply.json --interval-ms 500" << std::endl;
    std::cout << std::endl;
}

bool parse_command_line(int argc, char** argv, CommandLine& cmd)
{
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--quiet") {
            cmd.quiet = true;
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument" << std::endl;
            return false;
        }
        const std::string value = argv[++i];

        if (arg == "--image") {
            cmd.images.push_back(value);
        }
        else if (arg == "--reply") {
            cmd.reply_file = value;
        }
        else if (arg == "--config") {
            cmd.config_file = value;
        }
        else if (arg == "--profile") {
            cmd.profile = value;
        }
        else if (arg == "--stats") {
            cmd.stats_file = value;
        }
        else if (arg == "--mode") {
            if (value == "single") {
                cmd.mode = platerec::RecognitionMode::SINGLE_SHOT;
            }
            else if (value == "realtime") {
                cmd.mode = platerec::RecognitionMode::REALTIME;
            }
            else {
                std::cerr << "Error: --mode must be single or realtime" << std::endl;
                return false;
            }
        }
        else if (arg == "--interval-ms") {
            try {
                cmd.interval_ms = std::stoll(value);
            }
            catch (const std::exception&) {
                std::cerr << "Error: --interval-ms requires a number" << std::endl;
                return false;
            }
            if (cmd.interval_ms < 0) {
                std::cerr << "Error: --interval-ms must be >= 0" << std::endl;
                return false;
            }
        }
        else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    if (cmd.images.empty() || cmd.reply_file.empty()) {
        std::cerr << "Error: Must specify at least one --image and a --reply file" << std::endl;
        return false;
    }

    if (!cmd.profile.empty() && cmd.config_file.empty()) {
        std::cerr << "Error: --profile requires --config" << std::endl;
        return false;
    }

    return true;
}

void print_result(const std::string& path, const platerec::PipelineResult& result)
{
    std::cout << path << " [" << platerec::pipeline_status_name(result.status) << "]";

    if (result.succeeded()) {
        std::cout << " | " << result.plate.full_text
                  << " | " << platerec::plate_category_name(result.plate.category)
                  << " | " << result.plate.confidence << "%";
        if (result.from_cache) {
            std::cout << " | cached";
        }
        if (result.occurrence_count > 0) {
            std::cout << " | seen " << result.occurrence_count << "x";
        }
    }
    else {
        std::cout << " | " << platerec::error_code_name(result.error.code)
                  << " | " << result.error.message
                  << " | " << result.error.suggestion;
        for (const auto& validation : result.error.validation_errors) {
            std::cout << std::endl << "    - " << platerec::validation_error_name(validation.code)
                      << ": " << validation.message;
        }
    }

    std::cout << " | " << std::fixed << std::setprecision(1) << result.processing_time_ms << " ms"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(argv[0]);
        return 1;
    }

    // Load configuration
    platerec::PipelineConfig config;
    if (!cmd.config_file.empty()) {
        std::cout << "Loading configuration from: " << cmd.config_file << std::endl;
        if (!cmd.profile.empty()) {
            std::cout << "Using profile: " << cmd.profile << std::endl;
        }

        if (!config.load_from_yaml(cmd.config_file, cmd.profile)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    if (cmd.quiet) {
        config.logging.log_to_console = false;
    }

    // Validate configuration
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }

    // Print configuration
    std::cout << std::endl;
    config.print();
    std::cout << std::endl;

    std::shared_ptr<platerec::Recognizer> recognizer =
        std::make_shared<platerec::ReplyFileRecognizer>(cmd.reply_file);

    std::unique_ptr<platerec::RecognitionPipeline> pipeline;
    try {
        pipeline = std::make_unique<platerec::RecognitionPipeline>(config, recognizer);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to create pipeline: " << e.what() << std::endl;
        return 1;
    }

    // Signal handlers cannot take locks; forward the flag from a watcher thread
    platerec::CancellationToken cancel;
    std::atomic<bool> finished(false);
    std::thread watcher([&cancel, &finished]() {
        while (!finished) {
            if (g_interrupted) {
                std::cout << "\nInterrupt received, stopping..." << std::endl;
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    int exit_code = 0;
    for (size_t i = 0; i < cmd.images.size() && !cancel.is_cancelled(); ++i) {
        if (i > 0 && cmd.interval_ms > 0 && cancel.wait_for(cmd.interval_ms)) {
            break;
        }

        platerec::CapturedImage image;
        if (!platerec::load_image_from_png(cmd.images[i], image)) {
            std::cerr << "Failed to load image " << cmd.images[i] << std::endl;
            exit_code = 1;
            continue;
        }

        const platerec::PipelineResult result = pipeline->recognize(image, cmd.mode, cancel);
        print_result(cmd.images[i], result);

        if (!result.succeeded()) {
            exit_code = 1;
        }
    }

    finished = true;
    watcher.join();

    pipeline->print_summary();

    if (!cmd.stats_file.empty() && !pipeline->write_statistics(cmd.stats_file)) {
        exit_code = 1;
    }

    if (g_interrupted) {
        std::cout << "Recognition interrupted by user" << std::endl;
        return 130; // Standard exit code for SIGINT
    }

    return exit_code;
}
