#pragma once

/// @file request_json.h
/// @brief JSON decoding of compiler requests and encoding of built queries
///
/// Request documents use the camelCase keys of the analytics API:
/// @code
/// {
///   "tenantId": "project_1",
///   "startDate": 1717200000000,            // epoch milliseconds
///   "endDate": 1717286400000,
///   "previousPeriodStartDate": 1717113600000,
///   "series": [{"metric": "metadata.user_id", "aggregation": "cardinality"}],
///   "filters": {"topics.topics": ["t1"]},
///   "groupBy": "metadata.labels",
///   "timeScale": 60,                        // minutes, or "full"
///   "timeZone": "Europe/Amsterdam"
/// }
/// @endcode

#include <string>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analytics/types.h"

namespace tracelens::analytics {

absl::StatusOr<TimeseriesRequest> ParseTimeseriesRequest(const std::string& text);
absl::StatusOr<FilterOptionsRequest> ParseFilterOptionsRequest(const std::string& text);
absl::StatusOr<DocumentsRequest> ParseDocumentsRequest(const std::string& text);

/// @brief Decode a filters object in any of its three nesting shapes
absl::StatusOr<FilterSpec> ParseFilterSpec(const nlohmann::json& filters);

/// @brief Timestamps become "YYYY-MM-DD HH:MM:SS.mmm" in UTC
nlohmann::json ParamsToJson(const ParamMap& params);

/// @brief {"sql": ..., "params": {...}}
nlohmann::json BuiltQueryToJson(const BuiltQuery& query);

/// @brief {"documentsSql": ..., "totalSql": ..., "params": {...}}
nlohmann::json TopDocumentsQueryToJson(const TopDocumentsQuery& query);

}  // namespace tracelens::analytics
