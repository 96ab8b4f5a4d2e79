#include "matchtrack/core/errors.h"

namespace matchtrack {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ValidationError: return "VALIDATION_ERROR";
        case ErrorCode::InvalidFormat: return "INVALID_FORMAT";
        case ErrorCode::MissingField: return "MISSING_REQUIRED_FIELD";
        case ErrorCode::DetectionError: return "DETECTION_ERROR";
        case ErrorCode::TrackingError: return "TRACKING_ERROR";
        case ErrorCode::ConfigError: return "CONFIG_ERROR";
    }
    return "UNKNOWN_ERROR";
}

AnalysisError::AnalysisError(ErrorCode code, const std::string& message, bool retryable)
        : std::runtime_error(message), code_(code), retryable_(retryable) {}

ValidationError::ValidationError(const std::string& message, ErrorCode code)
        : AnalysisError(code, message, false) {}

DetectionError::DetectionError(const std::string& message)
        : AnalysisError(ErrorCode::DetectionError, message, true) {}

TrackingError::TrackingError(const std::string& message)
        : AnalysisError(ErrorCode::TrackingError, message, true) {}

} // namespace matchtrack
