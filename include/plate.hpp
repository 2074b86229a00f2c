#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace platerec {

/**
 * Captured camera frame (8-bit RGBA, row-major, no padding)
 *
 * The pixel buffer is shared and immutable, so copies are cheap and a frame
 * can be handed to a worker thread that outlives the request.
 */
struct CapturedImage {
    static constexpr uint32_t CHANNELS = 4;

    std::shared_ptr<const std::vector<uint8_t>> pixels;
    uint32_t width;
    uint32_t height;
    int64_t captured_at_ms;

    CapturedImage() : width(0), height(0), captured_at_ms(0) {}

    CapturedImage(std::vector<uint8_t> rgba, uint32_t w, uint32_t h, int64_t ts = 0)
        : pixels(std::make_shared<const std::vector<uint8_t>>(std::move(rgba))),
          width(w), height(h), captured_at_ms(ts) {}

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    const uint8_t* data() const { return pixels ? pixels->data() : nullptr; }

    size_t byte_count() const { return pixels ? pixels->size() : 0; }

    bool is_valid() const {
        return pixels && width > 0 && height > 0
               && pixels->size() == pixel_count() * CHANNELS;
    }
};

/**
 * Plate category as printed on the plate
 */
enum class PlateCategory {
    REGULAR,
    LIGHT,
    COMMERCIAL,
    RENTAL_OR_SHARED,
    DIPLOMATIC
};

/**
 * Structured recognition result
 */
struct PlateResult {
    std::string region;           // e.g. "品川"
    std::string classification;   // e.g. "330"
    std::string kana;             // e.g. "あ"
    std::string serial;           // e.g. "1234"
    std::string full_text;        // region + classification + kana + serial
    int confidence;               // 0..100
    PlateCategory category;
    int64_t recognized_at_ms;

    PlateResult()
        : confidence(0), category(PlateCategory::REGULAR), recognized_at_ms(0) {}

    bool operator==(const PlateResult& other) const;
    bool operator!=(const PlateResult& other) const { return !(*this == other); }
};

// Concatenation rule for PlateResult::full_text
std::string compose_full_text(const std::string& region,
                              const std::string& classification,
                              const std::string& kana,
                              const std::string& serial);

/**
 * @brief Build a PlateResult with full_text derived from its parts
 * @param confidence Clamped to [0, 100]
 */
PlateResult make_plate_result(const std::string& region,
                              const std::string& classification,
                              const std::string& kana,
                              const std::string& serial,
                              int confidence,
                              PlateCategory category,
                              int64_t recognized_at_ms);

bool is_full_text_consistent(const PlateResult& result);

const char* plate_category_name(PlateCategory category);

/**
 * @brief Parse a category name ("REGULAR", "LIGHT", "COMMERCIAL", "RENTAL", "DIPLOMATIC")
 * @return true if the name is known
 */
bool parse_plate_category(const std::string& name, PlateCategory& category);

/**
 * @brief Rental and car-share plates carry the kana わ or れ
 */
bool is_rental_kana(const std::string& kana);

} // namespace platerec
