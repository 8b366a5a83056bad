#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace promptshield {

/**
 * @brief Error categories for the shield
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    VALIDATION_ERROR,
    DETECTOR_UNAVAILABLE,
    EXTERNAL_SERVICE_ERROR,
    UNSUPPORTED_STRATEGY,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "None";
        case ErrorCategory::CONFIG_ERROR:           return "ConfigError";
        case ErrorCategory::VALIDATION_ERROR:       return "ValidationError";
        case ErrorCategory::DETECTOR_UNAVAILABLE:   return "DetectorUnavailable";
        case ErrorCategory::EXTERNAL_SERVICE_ERROR: return "ExternalServiceError";
        case ErrorCategory::UNSUPPORTED_STRATEGY:   return "UnsupportedStrategy";
        case ErrorCategory::INTERNAL_ERROR:         return "InternalError";
        default: return "Unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Exception for failures that must cross a component boundary
 *        (startup validation, illegal state transitions).
 */
class ShieldError : public std::runtime_error {
public:
    ShieldError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

} // namespace promptshield
