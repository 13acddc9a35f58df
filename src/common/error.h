#pragma once

/// @file error.h
/// @brief TraceLens error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace tracelens {

/// @brief Error codes used by the query compiler
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kUnimplemented,
    kInternal,

    // Compiler-specific error codes
    kDeserializationError,
    kConfigurationError,
    kValidationError,
    kUnsupportedMetric,
};

/// @brief Convert a TraceLens error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return absl::InternalError(message);
}

/// Payload type URL attached to "unsupported metric" statuses.
inline constexpr std::string_view kUnsupportedMetricTypeUrl =
    "type.tracelens.dev/unsupported-metric";

/// @brief Create the typed error raised for metrics the compiler refuses
///        to translate (the status carries the metric name as payload)
absl::Status UnsupportedMetricError(std::string_view metric);

/// @brief True if the status was produced by UnsupportedMetricError
bool IsUnsupportedMetric(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define TRACELENS_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define TRACELENS_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    TRACELENS_ASSIGN_OR_RETURN_IMPL(                                           \
        TRACELENS_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define TRACELENS_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define TRACELENS_CONCAT(a, b) TRACELENS_CONCAT_IMPL(a, b)
#define TRACELENS_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define TRACELENS_CHECK_OR_RETURN(condition, error_status)                     \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace tracelens
