#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace sanitizer {

/**
 * @brief Error categories for the sanitizer
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    CATALOG_ERROR,
    REFINEMENT_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::CONFIG_ERROR:     return "config_error";
        case ErrorCategory::CATALOG_ERROR:    return "catalog_error";
        case ErrorCategory::REFINEMENT_ERROR: return "refinement_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
        default:                              return "unknown";
    }
}

/**
 * @brief Fatal sanitizer error (misconfiguration, pattern catalog failure).
 *
 * Distinct from a normal SanitizationResult: content never causes this.
 */
class SanitizerError : public std::runtime_error {
public:
    SanitizerError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Refinement layer failure (timeout, remote error, malformed completion).
 *
 * Always caught by the pipeline; the affected field keeps its Layer-1 output.
 */
class RefinementError : public SanitizerError {
public:
    explicit RefinementError(const std::string& message)
        : SanitizerError(ErrorCategory::REFINEMENT_ERROR, message) {}
};

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

} // namespace sanitizer
