#pragma once

#include <stdexcept>
#include <string>

namespace matchtrack {

enum class ErrorCode {
    ValidationError,
    InvalidFormat,
    MissingField,
    DetectionError,
    TrackingError,
    ConfigError
};

const char* to_string(ErrorCode code);

// Жёсткая ошибка ядра. Внешний оркестратор решает, перезапускать ли шаг
// (retryable), внутри ядра повторов нет.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorCode code, const std::string& message, bool retryable = false);

    ErrorCode code() const { return code_; }
    bool retryable() const { return retryable_; }

private:
    ErrorCode code_;
    bool retryable_;
};

// Структурно неверный вход: <4 точек для гомографии, битый набор RawEvent и т.п.
class ValidationError : public AnalysisError {
public:
    explicit ValidationError(const std::string& message, ErrorCode code = ErrorCode::ValidationError);
};

class DetectionError : public AnalysisError {
public:
    explicit DetectionError(const std::string& message);
};

class TrackingError : public AnalysisError {
public:
    explicit TrackingError(const std::string& message);
};

} // namespace matchtrack
