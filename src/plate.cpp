#include "plate.hpp"
#include <algorithm>

namespace platerec {

bool PlateResult::operator==(const PlateResult& other) const {
    return region == other.region
           && classification == other.classification
           && kana == other.kana
           && serial == other.serial
           && full_text == other.full_text
           && confidence == other.confidence
           && category == other.category
           && recognized_at_ms == other.recognized_at_ms;
}

std::string compose_full_text(const std::string& region,
                              const std::string& classification,
                              const std::string& kana,
                              const std::string& serial)
{
    std::string text;
    text.reserve(region.size() + classification.size() + kana.size() + serial.size());
    text += region;
    text += classification;
    text += kana;
    text += serial;
    return text;
}

PlateResult make_plate_result(const std::string& region,
                              const std::string& classification,
                              const std::string& kana,
                              const std::string& serial,
                              int confidence,
                              PlateCategory category,
                              int64_t recognized_at_ms)
{
    PlateResult result;
    result.region = region;
    result.classification = classification;
    result.kana = kana;
    result.serial = serial;
    result.full_text = compose_full_text(region, classification, kana, serial);
    result.confidence = std::max(0, std::min(100, confidence));
    result.category = category;
    result.recognized_at_ms = recognized_at_ms;
    return result;
}

bool is_full_text_consistent(const PlateResult& result) {
    return result.full_text ==
           compose_full_text(result.region, result.classification, result.kana, result.serial);
}

const char* plate_category_name(PlateCategory category) {
    switch (category) {
        case PlateCategory::REGULAR:          return "REGULAR";
        case PlateCategory::LIGHT:            return "LIGHT";
        case PlateCategory::COMMERCIAL:       return "COMMERCIAL";
        case PlateCategory::RENTAL_OR_SHARED: return "RENTAL";
        case PlateCategory::DIPLOMATIC:       return "DIPLOMATIC";
    }
    return "REGULAR";
}

bool parse_plate_category(const std::string& name, PlateCategory& category) {
    if (name == "REGULAR")    { category = PlateCategory::REGULAR; return true; }
    if (name == "LIGHT")      { category = PlateCategory::LIGHT; return true; }
    if (name == "COMMERCIAL") { category = PlateCategory::COMMERCIAL; return true; }
    if (name == "RENTAL")     { category = PlateCategory::RENTAL_OR_SHARED; return true; }
    if (name == "DIPLOMATIC") { category = PlateCategory::DIPLOMATIC; return true; }
    return false;
}

bool is_rental_kana(const std::string& kana) {
    return kana == "わ" || kana == "れ";
}

} // namespace platerec
