/**
 * @file recognizer.cpp
 * @brief Vision model reply interpretation and the reply-file recognizer
 *
 * Model replies are JSON objects embedded in free text. JSON is a subset of
 * YAML flow syntax, so the object is parsed with yaml-cpp.
 */

#include "recognizer.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace platerec {

RecognizeOutcome RecognizeOutcome::success(const RecognizerResponse& response)
{
    RecognizeOutcome outcome;
    outcome.ok = true;
    outcome.response = response;
    return outcome;
}

RecognizeOutcome RecognizeOutcome::failure(RecognizerFaultKind kind, const std::string& message,
                                           bool retryable)
{
    RecognizeOutcome outcome;
    outcome.ok = false;
    outcome.fault = RecognizerFault(kind, message, retryable);
    return outcome;
}

bool extract_json_object(const std::string& text, std::string& json)
{
    const size_t open = text.find('{');
    const size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return false;
    }
    json = text.substr(open, close - open + 1);
    return true;
}

PlateCategory determine_plate_category(const std::string& kana, const std::string& model_label)
{
    if (is_rental_kana(kana)) {
        return PlateCategory::RENTAL_OR_SHARED;
    }

    PlateCategory category = PlateCategory::REGULAR;
    if (parse_plate_category(model_label, category)) {
        return category;
    }
    return PlateCategory::REGULAR;
}

namespace {

// Non-empty scalar field, or empty string
std::string scalar_field(const YAML::Node& node, const char* key)
{
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        return std::string();
    }
    return value.as<std::string>();
}

} // anonymous namespace

RecognizeOutcome interpret_model_reply(const std::string& raw_text, int64_t now_ms)
{
    if (raw_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return RecognizeOutcome::failure(RecognizerFaultKind::INVALID_RESPONSE,
                                         "Empty reply from recognition model", true);
    }

    std::string json;
    if (!extract_json_object(raw_text, json)) {
        return RecognizeOutcome::failure(RecognizerFaultKind::PARSE_ERROR,
                                         "Recognition model reply contains no JSON object", false);
    }

    RecognizerResponse response;
    response.raw_text = raw_text;

    try {
        const YAML::Node node = YAML::Load(json);
        if (!node.IsMap()) {
            return RecognizeOutcome::failure(RecognizerFaultKind::PARSE_ERROR,
                                             "Recognition model reply is not an object", false);
        }

        const bool detected = node["detected"] ? node["detected"].as<bool>() : false;
        if (!detected) {
            return RecognizeOutcome::success(response);
        }

        const std::string region = scalar_field(node, "region");
        const std::string classification = scalar_field(node, "classificationNumber");
        const std::string kana = scalar_field(node, "hiragana");
        const std::string serial = scalar_field(node, "serialNumber");

        if (region.empty() || classification.empty() || kana.empty() || serial.empty()) {
            return RecognizeOutcome::success(response);
        }

        const double raw_confidence = node["confidence"] ? node["confidence"].as<double>() : 0.0;
        const PlateCategory category = determine_plate_category(kana, scalar_field(node, "plateType"));

        // Clamp before the cast; NaN counts as no confidence
        double confidence = 0.0;
        if (!std::isnan(raw_confidence)) {
            confidence = std::max(0.0, std::min(100.0, raw_confidence));
        }

        response.has_plate = true;
        response.plate = make_plate_result(region, classification, kana, serial,
                                           static_cast<int>(confidence + 0.5),
                                           category, now_ms);
        response.confidence = response.plate.confidence;
    }
    catch (const YAML::Exception& e) {
        return RecognizeOutcome::failure(RecognizerFaultKind::PARSE_ERROR,
                                         std::string("Cannot parse recognition model reply: ") + e.what(),
                                         false);
    }

    return RecognizeOutcome::success(response);
}

// ============================================================================
// ReplyFileRecognizer
// ============================================================================

ReplyFileRecognizer::ReplyFileRecognizer(const std::string& reply_path, const Clock* clock)
    : reply_path_(reply_path)
    , clock_(clock ? *clock : Clock::steady())
{
}

RecognizeOutcome ReplyFileRecognizer::recognize(const CapturedImage& /*image*/,
                                                const CancellationToken& cancel)
{
    if (cancel.is_cancelled()) {
        return RecognizeOutcome::failure(RecognizerFaultKind::REQUEST_CANCELLED,
                                         "Request was cancelled", false);
    }

    std::ifstream ifs(reply_path_);
    if (!ifs) {
        return RecognizeOutcome::failure(RecognizerFaultKind::API_CONNECTION_FAILED,
                                         "Cannot open reply file: " + reply_path_, false);
    }

    std::ostringstream oss;
    oss << ifs.rdbuf();
    return interpret_model_reply(oss.str(), clock_.now_ms());
}

} // namespace platerec
