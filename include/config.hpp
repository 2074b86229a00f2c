#pragma once

#include <string>
#include <cstdint>
#include <yaml-cpp/yaml.h>
#include "cache.hpp"
#include "quality.hpp"
#include "rate_limiter.hpp"
#include "recognition_log.hpp"
#include "retry.hpp"
#include "suppressor.hpp"

namespace platerec {

/**
 * @brief Recognition pipeline configuration structure
 *
 * Aggregates the settings of every pipeline component. Each component
 * reads its own section; absent keys keep their defaults.
 *
 * Layout:
 *   quality:      { min_width, min_height, min_laplacian_variance, max_angle_deg,
 *                   min_brightness, max_brightness, edge_magnitude_threshold }
 *   cache:        { ttl_ms, max_entries }
 *   rate_limit:   { max_concurrent, window_ms, max_requests }
 *   suppression:  { duration_ms, max_history_size }
 *   retry:        { max_retries, initial_delay_ms, max_delay_ms, backoff_multiplier }
 *   timeouts:     { recognition_ms, request_ms }
 *   logging:      { console, level, max_entries }
 */
struct PipelineConfig {
    QualityThresholds quality;
    CacheConfig cache;
    RateLimitConfig rate_limit;
    SuppressionConfig suppression;
    RetryConfig retry;
    LogConfig logging;

    int64_t recognition_timeout_ms = 5000;   // Per recognizer attempt
    int64_t request_timeout_ms = 30000;      // Whole retry sequence

    /**
     * @brief Load configuration from YAML file
     * @param yaml_path Path to YAML configuration file
     * @param profile_name Optional profile name to load
     * @return true if successful, false otherwise
     */
    bool load_from_yaml(const std::string& yaml_path, const std::string& profile_name = "");

    /**
     * @brief Load configuration from YAML node
     * @param node YAML node containing configuration
     * @return true if successful, false otherwise
     */
    bool load_from_node(const YAML::Node& node);

    /**
     * @brief Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;

    /**
     * @brief Print configuration summary to stdout
     */
    void print() const;
};

} // namespace platerec
