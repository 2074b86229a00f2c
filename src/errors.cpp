/**
 * @file errors.cpp
 * @brief Error taxonomy and remediation text
 *
 * Every caller-visible error carries a message and a suggestion. The
 * suggestion text is fixed per code so user interfaces can rely on it.
 */

#include "errors.hpp"

namespace platerec {

ValidationError make_validation_error(ValidationErrorCode code)
{
    ValidationError error;
    error.code = code;

    switch (code) {
        case ValidationErrorCode::RESOLUTION:
            error.message = "Image resolution is too low";
            error.suggestion = "Move closer to the plate and capture again";
            break;
        case ValidationErrorCode::BLUR:
            error.message = "Image is blurred";
            error.suggestion = "Hold the camera steady and capture again";
            break;
        case ValidationErrorCode::ANGLE_TOO_STEEP:
            error.message = "Capture angle is too steep";
            error.suggestion = "Capture the plate from the front";
            break;
        case ValidationErrorCode::TOO_DARK:
            error.message = "Image is too dark";
            error.suggestion = "Capture in a brighter location";
            break;
        case ValidationErrorCode::TOO_BRIGHT:
            error.message = "Image is too bright";
            error.suggestion = "Avoid direct sunlight and capture again";
            break;
    }

    return error;
}

const char* validation_error_name(ValidationErrorCode code)
{
    switch (code) {
        case ValidationErrorCode::RESOLUTION:      return "RESOLUTION";
        case ValidationErrorCode::BLUR:            return "BLUR";
        case ValidationErrorCode::ANGLE_TOO_STEEP: return "ANGLE_TOO_STEEP";
        case ValidationErrorCode::TOO_DARK:        return "TOO_DARK";
        case ValidationErrorCode::TOO_BRIGHT:      return "TOO_BRIGHT";
    }
    return "UNKNOWN";
}

const char* recognizer_fault_name(RecognizerFaultKind kind)
{
    switch (kind) {
        case RecognizerFaultKind::API_CONNECTION_FAILED: return "API_CONNECTION_FAILED";
        case RecognizerFaultKind::TIMEOUT:               return "TIMEOUT";
        case RecognizerFaultKind::INVALID_RESPONSE:      return "INVALID_RESPONSE";
        case RecognizerFaultKind::NO_PLATE_DETECTED:     return "NO_PLATE_DETECTED";
        case RecognizerFaultKind::PARSE_ERROR:           return "PARSE_ERROR";
        case RecognizerFaultKind::REQUEST_CANCELLED:     return "REQUEST_CANCELLED";
        case RecognizerFaultKind::UNKNOWN:               return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::PLATE_NOT_RECOGNIZED:  return "PLATE_NOT_RECOGNIZED";
        case ErrorCode::INVALID_IMAGE:         return "INVALID_IMAGE";
        case ErrorCode::RATE_LIMITED:          return "RATE_LIMITED";
        case ErrorCode::TIMEOUT:               return "TIMEOUT";
        case ErrorCode::API_CONNECTION_FAILED: return "API_CONNECTION_FAILED";
        case ErrorCode::REQUEST_CANCELLED:     return "REQUEST_CANCELLED";
    }
    return "UNKNOWN";
}

RecognitionError make_recognition_error(ErrorCode code)
{
    RecognitionError error;
    error.code = code;

    switch (code) {
        case ErrorCode::PLATE_NOT_RECOGNIZED:
            error.message = "No license plate was recognized";
            error.suggestion = "Point the camera at the license plate";
            break;
        case ErrorCode::INVALID_IMAGE:
            error.message = "Invalid image";
            error.suggestion = "Use a valid image file";
            break;
        case ErrorCode::RATE_LIMITED:
            error.message = "Request limit exceeded";
            error.suggestion = "Wait a moment and try again";
            break;
        case ErrorCode::TIMEOUT:
            error.message = "Recognition timed out";
            error.suggestion = "Check your network connection";
            break;
        case ErrorCode::API_CONNECTION_FAILED:
            error.message = "Cannot connect to the recognition service";
            error.suggestion = "Wait a moment and try again";
            break;
        case ErrorCode::REQUEST_CANCELLED:
            error.message = "Request was cancelled";
            error.suggestion = "Start the recognition again";
            break;
    }

    return error;
}

RecognitionError make_invalid_image_error(const std::vector<ValidationError>& errors)
{
    RecognitionError error = make_recognition_error(ErrorCode::INVALID_IMAGE);
    if (!errors.empty()) {
        error.message = errors.front().message;
        error.suggestion = errors.front().suggestion;
    }
    error.validation_errors = errors;
    return error;
}

RecognitionError error_from_fault(const RecognizerFault& fault)
{
    ErrorCode code = ErrorCode::API_CONNECTION_FAILED;

    switch (fault.kind) {
        case RecognizerFaultKind::TIMEOUT:
            code = ErrorCode::TIMEOUT;
            break;
        case RecognizerFaultKind::NO_PLATE_DETECTED:
        case RecognizerFaultKind::INVALID_RESPONSE:
        case RecognizerFaultKind::PARSE_ERROR:
            code = ErrorCode::PLATE_NOT_RECOGNIZED;
            break;
        case RecognizerFaultKind::REQUEST_CANCELLED:
            code = ErrorCode::REQUEST_CANCELLED;
            break;
        case RecognizerFaultKind::API_CONNECTION_FAILED:
        case RecognizerFaultKind::UNKNOWN:
            code = ErrorCode::API_CONNECTION_FAILED;
            break;
    }

    RecognitionError error = make_recognition_error(code);
    if (!fault.message.empty()) {
        error.message = fault.message;
    }
    return error;
}

} // namespace platerec
