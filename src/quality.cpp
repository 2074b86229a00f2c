/**
 * @file quality.cpp
 * @brief Image quality metrics and the pre-network quality gate
 *
 * Grayscale conversion, brightness, Laplacian variance and Sobel orientation
 * are each a single O(width * height) pass over the frame.
 */

#include "quality.hpp"
#include "stats.hpp"
#include <cmath>
#include <algorithm>

namespace platerec {

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;

} // anonymous namespace

std::vector<float> to_grayscale(const CapturedImage& image)
{
    std::vector<float> gray;
    if (!image.is_valid()) {
        return gray;
    }

    const size_t count = image.pixel_count();
    const uint8_t* px = image.data();
    gray.resize(count);

    for (size_t i = 0; i < count; ++i) {
        const uint8_t* p = px + i * CapturedImage::CHANNELS;
        gray[i] = static_cast<float>(0.299 * p[0] + 0.587 * p[1] + 0.114 * p[2]);
    }

    return gray;
}

double compute_average_brightness(const std::vector<float>& gray)
{
    if (gray.empty()) return 0.0;

    double total = 0.0;
    for (float v : gray) {
        total += v;
    }
    return total / static_cast<double>(gray.size());
}

double compute_laplacian_variance(const std::vector<float>& gray, uint32_t width, uint32_t height)
{
    if (width < 3 || height < 3 || gray.size() != static_cast<size_t>(width) * height) {
        return 0.0;
    }

    double sum = 0.0;
    double sum_sq = 0.0;
    uint64_t n = 0;

    for (uint32_t y = 1; y + 1 < height; ++y) {
        const float* row = &gray[static_cast<size_t>(y) * width];
        const float* up = row - width;
        const float* down = row + width;

        for (uint32_t x = 1; x + 1 < width; ++x) {
            const double value = static_cast<double>(up[x]) + down[x]
                               + row[x - 1] + row[x + 1]
                               - 4.0 * row[x];
            sum += value;
            sum_sq += value * value;
            n++;
        }
    }

    const double mean = sum / n;
    return std::max(0.0, sum_sq / n - mean * mean);
}

double estimate_plate_angle(const std::vector<float>& gray, uint32_t width, uint32_t height,
                            double edge_threshold)
{
    if (width < 3 || height < 3 || gray.size() != static_cast<size_t>(width) * height) {
        return 0.0;
    }

    AngleHistogram histogram;

    for (uint32_t y = 1; y + 1 < height; ++y) {
        const float* row = &gray[static_cast<size_t>(y) * width];
        const float* up = row - width;
        const float* down = row + width;

        for (uint32_t x = 1; x + 1 < width; ++x) {
            const double gx = -up[x - 1] + up[x + 1]
                            - 2.0 * row[x - 1] + 2.0 * row[x + 1]
                            - down[x - 1] + down[x + 1];

            const double gy = -up[x - 1] - 2.0 * up[x] - up[x + 1]
                            + down[x - 1] + 2.0 * down[x] + down[x + 1];

            const double magnitude = std::sqrt(gx * gx + gy * gy);
            if (magnitude > edge_threshold) {
                histogram.accumulate(std::atan2(gy, gx) * kRadToDeg);
            }
        }
    }

    if (histogram.total_samples() == 0) {
        return 0.0;
    }

    // Plates are axis-aligned: horizontal (0/180) and vertical (90) edges are normal
    const double dominant = histogram.dominant_angle();
    return std::min(dominant, std::min(std::fabs(90.0 - dominant), std::fabs(180.0 - dominant)));
}

ImageQualityMetrics compute_quality_metrics(const CapturedImage& image, double edge_threshold)
{
    ImageQualityMetrics metrics;
    const std::vector<float> gray = to_grayscale(image);
    if (gray.empty()) {
        return metrics;
    }

    metrics.average_brightness = compute_average_brightness(gray);
    metrics.laplacian_variance = compute_laplacian_variance(gray, image.width, image.height);
    metrics.estimated_angle_deg = estimate_plate_angle(gray, image.width, image.height, edge_threshold);
    return metrics;
}

// ============================================================================
// QualityGate
// ============================================================================

QualityGate::QualityGate(const QualityThresholds& thresholds)
    : thresholds_(thresholds)
{
}

std::vector<ValidationError> QualityGate::validate(const CapturedImage& image,
                                                   const ImageQualityMetrics& metrics) const
{
    std::vector<ValidationError> errors;

    // Every check runs; callers need the full list
    check_resolution(image.width, image.height, errors);
    check_blur(metrics.laplacian_variance, errors);
    check_angle(metrics.estimated_angle_deg, errors);
    check_lighting(metrics.average_brightness, errors);

    return errors;
}

std::vector<ValidationError> QualityGate::evaluate(const CapturedImage& image,
                                                   ImageQualityMetrics& metrics) const
{
    metrics = compute_quality_metrics(image, thresholds_.edge_magnitude_threshold);
    return validate(image, metrics);
}

void QualityGate::check_resolution(uint32_t width, uint32_t height,
                                   std::vector<ValidationError>& errors) const
{
    if (width < thresholds_.min_width || height < thresholds_.min_height) {
        errors.push_back(make_validation_error(ValidationErrorCode::RESOLUTION));
    }
}

void QualityGate::check_blur(double laplacian_variance, std::vector<ValidationError>& errors) const
{
    if (laplacian_variance < thresholds_.min_laplacian_variance) {
        errors.push_back(make_validation_error(ValidationErrorCode::BLUR));
    }
}

void QualityGate::check_angle(double angle_deg, std::vector<ValidationError>& errors) const
{
    if (angle_deg > thresholds_.max_angle_deg) {
        errors.push_back(make_validation_error(ValidationErrorCode::ANGLE_TOO_STEEP));
    }
}

void QualityGate::check_lighting(double brightness, std::vector<ValidationError>& errors) const
{
    if (brightness < thresholds_.min_brightness) {
        errors.push_back(make_validation_error(ValidationErrorCode::TOO_DARK));
    }
    else if (brightness > thresholds_.max_brightness) {
        errors.push_back(make_validation_error(ValidationErrorCode::TOO_BRIGHT));
    }
}

} // namespace platerec
