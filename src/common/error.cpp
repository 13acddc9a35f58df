#include "error.h"

#include <absl/strings/cord.h>

namespace tracelens {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kDeserializationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnimplemented:
        case ErrorCode::kUnsupportedMetric:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), message);
}

absl::Status UnsupportedMetricError(std::string_view metric) {
    absl::Status status = MakeError(
        ErrorCode::kUnsupportedMetric,
        absl::StrCat("Metric '", metric, "' is not supported by the SQL backend"));
    status.SetPayload(kUnsupportedMetricTypeUrl, absl::Cord(metric));
    return status;
}

bool IsUnsupportedMetric(const absl::Status& status) {
    return status.code() == absl::StatusCode::kUnimplemented &&
           status.GetPayload(kUnsupportedMetricTypeUrl).has_value();
}

}  // namespace tracelens
