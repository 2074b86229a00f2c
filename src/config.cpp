/**
 * @file config.cpp
 * @brief Configuration file parsing and management
 *
 * Handles YAML configuration loading with support for multiple profiles
 * and parameter validation.
 */

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <stdexcept>

namespace platerec {

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

bool PipelineConfig::load_from_yaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        if (!profile_name.empty()) {
            if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
                std::cerr << "Profile not found: " << profile_name << std::endl;
                return false;
            }
            // Root settings first, then the profile overrides them
            if (!load_from_node(config_file)) {
                return false;
            }
            return load_from_node(config_file["profiles"][profile_name]);
        }

        return load_from_node(config_file);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool PipelineConfig::load_from_node(const YAML::Node& node)
{
    if (!node.IsMap()) {
        std::cerr << "Configuration must be a mapping" << std::endl;
        return false;
    }

    if (const YAML::Node q = node["quality"]) {
        quality.min_width = get_yaml_value(q, "min_width", quality.min_width);
        quality.min_height = get_yaml_value(q, "min_height", quality.min_height);
        quality.min_laplacian_variance = get_yaml_value(q, "min_laplacian_variance", quality.min_laplacian_variance);
        quality.max_angle_deg = get_yaml_value(q, "max_angle_deg", quality.max_angle_deg);
        quality.min_brightness = get_yaml_value(q, "min_brightness", quality.min_brightness);
        quality.max_brightness = get_yaml_value(q, "max_brightness", quality.max_brightness);
        quality.edge_magnitude_threshold = get_yaml_value(q, "edge_magnitude_threshold", quality.edge_magnitude_threshold);
    }

    if (const YAML::Node c = node["cache"]) {
        cache.ttl_ms = get_yaml_value(c, "ttl_ms", cache.ttl_ms);
        cache.max_entries = get_yaml_value(c, "max_entries", cache.max_entries);
    }

    if (const YAML::Node r = node["rate_limit"]) {
        rate_limit.max_concurrent = get_yaml_value(r, "max_concurrent", rate_limit.max_concurrent);
        rate_limit.window_ms = get_yaml_value(r, "window_ms", rate_limit.window_ms);
        rate_limit.max_requests = get_yaml_value(r, "max_requests", rate_limit.max_requests);
    }

    if (const YAML::Node s = node["suppression"]) {
        suppression.suppression_duration_ms = get_yaml_value(s, "duration_ms", suppression.suppression_duration_ms);
        suppression.max_history_size = get_yaml_value(s, "max_history_size", suppression.max_history_size);
    }

    if (const YAML::Node r = node["retry"]) {
        retry.max_retries = get_yaml_value(r, "max_retries", retry.max_retries);
        retry.initial_delay_ms = get_yaml_value(r, "initial_delay_ms", retry.initial_delay_ms);
        retry.max_delay_ms = get_yaml_value(r, "max_delay_ms", retry.max_delay_ms);
        retry.backoff_multiplier = get_yaml_value(r, "backoff_multiplier", retry.backoff_multiplier);
    }

    if (const YAML::Node t = node["timeouts"]) {
        recognition_timeout_ms = get_yaml_value(t, "recognition_ms", recognition_timeout_ms);
        request_timeout_ms = get_yaml_value(t, "request_ms", request_timeout_ms);
    }

    if (const YAML::Node l = node["logging"]) {
        logging.log_to_console = get_yaml_value(l, "console", logging.log_to_console);
        logging.max_entries = get_yaml_value(l, "max_entries", logging.max_entries);

        if (l["level"]) {
            const std::string level = l["level"].as<std::string>();
            if (!parse_log_level(level, logging.level)) {
                std::cerr << "Unknown log level: " << level << std::endl;
                return false;
            }
        }
    }

    // Validate parameters
    return validate();
}

bool PipelineConfig::validate() const
{
    if (quality.min_width == 0 || quality.min_height == 0) {
        std::cerr << "Minimum resolution must be > 0" << std::endl;
        return false;
    }

    if (quality.min_laplacian_variance < 0.0) {
        std::cerr << "Minimum Laplacian variance must be >= 0" << std::endl;
        return false;
    }

    if (quality.max_angle_deg < 0.0 || quality.max_angle_deg > 90.0) {
        std::cerr << "Maximum angle must be in [0, 90] degrees" << std::endl;
        return false;
    }

    if (quality.min_brightness < 0.0 || quality.max_brightness > 255.0
        || quality.min_brightness > quality.max_brightness) {
        std::cerr << "Brightness limits must satisfy 0 <= min <= max <= 255" << std::endl;
        return false;
    }

    if (cache.ttl_ms <= 0 || cache.max_entries == 0) {
        std::cerr << "Cache TTL and capacity must be > 0" << std::endl;
        return false;
    }

    if (rate_limit.max_concurrent == 0 || rate_limit.max_requests == 0 || rate_limit.window_ms <= 0) {
        std::cerr << "Rate limits and window must be > 0" << std::endl;
        return false;
    }

    if (suppression.suppression_duration_ms < 0 || suppression.max_history_size == 0) {
        std::cerr << "Suppression duration must be >= 0 and history size > 0" << std::endl;
        return false;
    }

    if (retry.initial_delay_ms < 0 || retry.max_delay_ms < retry.initial_delay_ms) {
        std::cerr << "Retry delays must satisfy 0 <= initial <= max" << std::endl;
        return false;
    }

    if (retry.backoff_multiplier < 1.0) {
        std::cerr << "Backoff multiplier must be >= 1" << std::endl;
        return false;
    }

    if (recognition_timeout_ms <= 0 || request_timeout_ms <= 0) {
        std::cerr << "Timeouts must be > 0" << std::endl;
        return false;
    }

    if (logging.max_entries == 0) {
        std::cerr << "Log capacity must be > 0" << std::endl;
        return false;
    }

    return true;
}

void PipelineConfig::print() const
{
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Min resolution: " << quality.min_width << "x" << quality.min_height << std::endl;
    std::cout << "  Min Laplacian variance: " << quality.min_laplacian_variance << std::endl;
    std::cout << "  Max angle: " << quality.max_angle_deg << " deg" << std::endl;
    std::cout << "  Brightness range: [" << quality.min_brightness << ", " << quality.max_brightness << "]" << std::endl;
    std::cout << "  Cache: TTL " << cache.ttl_ms << " ms, " << cache.max_entries << " entries" << std::endl;
    std::cout << "  Rate limit: " << rate_limit.max_concurrent << " concurrent, "
              << rate_limit.max_requests << " per " << rate_limit.window_ms << " ms" << std::endl;
    std::cout << "  Suppression: " << suppression.suppression_duration_ms << " ms, "
              << suppression.max_history_size << " keys" << std::endl;
    std::cout << "  Retry: " << retry.max_retries << " retries, delay " << retry.initial_delay_ms
              << ".." << retry.max_delay_ms << " ms, x" << retry.backoff_multiplier << std::endl;
    std::cout << "  Timeouts: recognition " << recognition_timeout_ms << " ms, request "
              << request_timeout_ms << " ms" << std::endl;
    std::cout << "  Logging: " << (logging.log_to_console ? "console" : "silent")
              << ", level " << log_level_name(logging.level) << std::endl;
}

} // namespace platerec
