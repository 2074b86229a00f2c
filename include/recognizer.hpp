#pragma once

#include <cstdint>
#include <string>
#include "cancellation.hpp"
#include "clock.hpp"
#include "errors.hpp"
#include "plate.hpp"

namespace platerec {

/**
 * Successful reply from the vision model
 */
struct RecognizerResponse {
    std::string raw_text;   // Model text as received
    bool has_plate;         // False when the model saw no complete plate
    PlateResult plate;      // Valid only if has_plate
    int confidence;

    RecognizerResponse() : has_plate(false), confidence(0) {}
};

/**
 * Either a response or a tagged fault
 */
struct RecognizeOutcome {
    bool ok;
    RecognizerResponse response;
    RecognizerFault fault;

    RecognizeOutcome() : ok(false) {}

    static RecognizeOutcome success(const RecognizerResponse& response);
    static RecognizeOutcome failure(RecognizerFaultKind kind, const std::string& message, bool retryable);
};

/**
 * @brief External vision recognizer (collaborator boundary)
 *
 * Implementations tag every failure as retryable or terminal: transport
 * errors and 5xx responses are retryable, malformed replies are not.
 * Calls may run on a worker thread that outlives the caller's wait, so an
 * implementation must not rely on the caller's stack. It should observe
 * `cancel` where it can.
 */
class Recognizer {
public:
    virtual ~Recognizer() {}

    virtual RecognizeOutcome recognize(const CapturedImage& image,
                                       const CancellationToken& cancel) = 0;
};

/**
 * @brief Locate the outermost {...} block in free-form model text
 * @return false if there is none
 */
bool extract_json_object(const std::string& text, std::string& json);

/**
 * @brief Turn a vision model reply into an outcome
 *
 * Expected reply (possibly wrapped in prose):
 *   {"detected": true, "region": "品川", "classificationNumber": "330",
 *    "hiragana": "あ", "serialNumber": "1234", "plateType": "REGULAR",
 *    "confidence": 98}
 *
 * Empty reply -> retryable INVALID_RESPONSE. No object or unparsable ->
 * terminal PARSE_ERROR. "detected": false or a missing field -> success
 * without a plate.
 */
RecognizeOutcome interpret_model_reply(const std::string& raw_text, int64_t now_ms);

/**
 * @brief Category rule: rental kana wins, then a valid model label, else REGULAR
 */
PlateCategory determine_plate_category(const std::string& kana, const std::string& model_label);

/**
 * @brief Recognizer that replays a model reply stored on disk
 *
 * Used for offline runs of the command-line tool. The file is re-read on
 * every call.
 */
class ReplyFileRecognizer : public Recognizer {
public:
    explicit ReplyFileRecognizer(const std::string& reply_path, const Clock* clock = nullptr);

    RecognizeOutcome recognize(const CapturedImage& image,
                               const CancellationToken& cancel) override;

private:
    std::string reply_path_;
    const Clock& clock_;
};

} // namespace platerec
