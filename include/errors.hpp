#pragma once

#include <string>
#include <vector>

namespace platerec {

/**
 * Image quality problems found before any network call
 */
enum class ValidationErrorCode {
    RESOLUTION,
    BLUR,
    ANGLE_TOO_STEEP,
    TOO_DARK,
    TOO_BRIGHT
};

struct ValidationError {
    ValidationErrorCode code;
    std::string message;
    std::string suggestion;
};

ValidationError make_validation_error(ValidationErrorCode code);

const char* validation_error_name(ValidationErrorCode code);

/**
 * Failure kinds reported by the external recognizer
 */
enum class RecognizerFaultKind {
    API_CONNECTION_FAILED,
    TIMEOUT,
    INVALID_RESPONSE,
    NO_PLATE_DETECTED,
    PARSE_ERROR,
    REQUEST_CANCELLED,
    UNKNOWN              // Anything the recognizer did not classify (e.g. a thrown exception)
};

/**
 * Tagged recognizer failure
 *
 * Retry decisions are made on `retryable` alone.
 */
struct RecognizerFault {
    RecognizerFaultKind kind;
    std::string message;
    bool retryable;

    RecognizerFault() : kind(RecognizerFaultKind::UNKNOWN), retryable(false) {}

    RecognizerFault(RecognizerFaultKind k, const std::string& msg, bool can_retry)
        : kind(k), message(msg), retryable(can_retry) {}
};

const char* recognizer_fault_name(RecognizerFaultKind kind);

/**
 * Error codes surfaced to pipeline callers
 */
enum class ErrorCode {
    PLATE_NOT_RECOGNIZED,
    INVALID_IMAGE,
    RATE_LIMITED,
    TIMEOUT,
    API_CONNECTION_FAILED,
    REQUEST_CANCELLED
};

const char* error_code_name(ErrorCode code);

/**
 * Caller-facing error: code, message and a non-empty remediation suggestion
 */
struct RecognitionError {
    ErrorCode code;
    std::string message;
    std::string suggestion;

    // Populated for INVALID_IMAGE, in check order
    std::vector<ValidationError> validation_errors;

    RecognitionError() : code(ErrorCode::API_CONNECTION_FAILED) {}
};

/**
 * @brief Build an error with the canonical message and suggestion for `code`
 */
RecognitionError make_recognition_error(ErrorCode code);

/**
 * @brief INVALID_IMAGE error carrying every validation error
 *
 * Message and suggestion are taken from the first validation error.
 */
RecognitionError make_invalid_image_error(const std::vector<ValidationError>& errors);

/**
 * @brief Map a recognizer fault to the caller-facing error
 *
 * The fault message is kept when it is non-empty.
 */
RecognitionError error_from_fault(const RecognizerFault& fault);

} // namespace platerec
