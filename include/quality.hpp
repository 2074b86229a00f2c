#pragma once

#include <cstdint>
#include <vector>
#include "plate.hpp"
#include "errors.hpp"

namespace platerec {

/**
 * @brief Image quality thresholds
 *
 * Single source of truth for every quality limit; loaded from configuration.
 */
struct QualityThresholds {
    uint32_t min_width = 640;
    uint32_t min_height = 480;
    double min_laplacian_variance = 100.0;   // Below this the frame is blurred
    double max_angle_deg = 45.0;             // Dominant edge deviation from axis
    double min_brightness = 50.0;            // Mean luminance, 0..255
    double max_brightness = 200.0;
    double edge_magnitude_threshold = 50.0;  // Sobel magnitude for angle votes
};

/**
 * Quality metrics derived from a captured frame
 */
struct ImageQualityMetrics {
    double laplacian_variance;
    double estimated_angle_deg;
    double average_brightness;

    ImageQualityMetrics()
        : laplacian_variance(0.0), estimated_angle_deg(0.0), average_brightness(0.0) {}

    ImageQualityMetrics(double variance, double angle, double brightness)
        : laplacian_variance(variance), estimated_angle_deg(angle), average_brightness(brightness) {}
};

/**
 * @brief Convert RGBA pixels to luminance (0.299R + 0.587G + 0.114B)
 * @return One value per pixel, row-major; empty for an invalid image
 */
std::vector<float> to_grayscale(const CapturedImage& image);

/**
 * @brief Mean luminance over all pixels
 */
double compute_average_brightness(const std::vector<float>& gray);

/**
 * @brief Variance of the 4-neighbour Laplacian over the image interior
 *
 * Kernel:
 *   [0,  1, 0]
 *   [1, -4, 1]
 *   [0,  1, 0]
 */
double compute_laplacian_variance(const std::vector<float>& gray, uint32_t width, uint32_t height);

/**
 * @brief Estimate how far the dominant edge orientation is from the plate axes
 *
 * Sobel gradients with magnitude above `edge_threshold` vote |atan2(gy, gx)|
 * into 5 degree bins. The dominant bin's distance to the nearest of
 * {0, 90, 180} degrees is returned. Frames without strong edges yield 0.
 */
double estimate_plate_angle(const std::vector<float>& gray, uint32_t width, uint32_t height,
                            double edge_threshold);

/**
 * @brief Compute all metrics in one grayscale conversion
 */
ImageQualityMetrics compute_quality_metrics(const CapturedImage& image,
                                            double edge_threshold = 50.0);

/**
 * @brief Pre-network quality gate
 *
 * Stateless apart from its thresholds; safe to share between threads.
 */
class QualityGate {
public:
    explicit QualityGate(const QualityThresholds& thresholds = QualityThresholds());

    /**
     * @brief Run every check against the supplied metrics
     * @param image Captured frame (only its dimensions are read)
     * @param metrics Precomputed quality metrics
     * @return All failed checks in order: resolution, blur, angle, lighting
     */
    std::vector<ValidationError> validate(const CapturedImage& image,
                                          const ImageQualityMetrics& metrics) const;

    /**
     * @brief Compute metrics from the pixels, then validate
     * @param metrics Computed metrics (output)
     */
    std::vector<ValidationError> evaluate(const CapturedImage& image,
                                          ImageQualityMetrics& metrics) const;

    // Individual checks; each appends at most one error
    void check_resolution(uint32_t width, uint32_t height, std::vector<ValidationError>& errors) const;
    void check_blur(double laplacian_variance, std::vector<ValidationError>& errors) const;
    void check_angle(double angle_deg, std::vector<ValidationError>& errors) const;
    void check_lighting(double brightness, std::vector<ValidationError>& errors) const;

    const QualityThresholds& thresholds() const { return thresholds_; }

private:
    QualityThresholds thresholds_;
};

} // namespace platerec
