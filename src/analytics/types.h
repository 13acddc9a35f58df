#pragma once

/// @file types.h
/// @brief Request and result types shared by the analytics query compiler

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tracelens::analytics {

using Timestamp = std::chrono::system_clock::time_point;

/// @brief Physical tables of the analytical schema
enum class TableId {
    kPrimary,    ///< trace_summaries, one row per trace
    kSpanChild,  ///< stored_spans, many rows per trace
    kEvalChild,  ///< evaluation_runs, many rows per trace
};

/// @brief Aggregation kinds accepted for a metric series
enum class AggKind {
    kAvg,
    kSum,
    kMin,
    kMax,
    kCardinality,
    kTerms,
    kMedian,
    kP90,
    kP95,
    kP99,
};

std::optional<AggKind> ParseAggKind(std::string_view name);
std::string_view AggKindName(AggKind kind);

/// @brief True for median, p90, p95 and p99
bool IsPercentile(AggKind kind);

/// @brief Quantile level for a percentile kind (0.5, 0.9, 0.95, 0.99)
double PercentileLevel(AggKind kind);

/// @brief Value bound to a named query placeholder
using ParamValue = std::variant<
    std::string,
    int64_t,
    double,
    std::vector<std::string>,
    std::vector<int64_t>,
    Timestamp
>;

/// @brief Placeholder name to bound value. Ordered so output is stable.
using ParamMap = std::map<std::string, ParamValue>;

/// @brief Second aggregation level applied across per-bucket values
struct PipelineSpec {
    std::string field;        ///< trace_id, user_id, thread_id or customer_id
    AggKind aggregation = AggKind::kAvg;  ///< avg, sum, min or max
};

/// @brief One requested metric series
struct MetricSpec {
    int index = 0;
    std::string field;
    AggKind aggregation = AggKind::kAvg;
    std::optional<std::string> key;
    std::optional<std::string> subkey;
    std::optional<PipelineSpec> pipeline;
};

using FilterValues = std::vector<std::string>;
using KeyedFilterValues = std::map<std::string, FilterValues>;
using SubkeyedFilterValues = std::map<std::string, std::map<std::string, FilterValues>>;

/// @brief Value list for a filter field, nested by zero, one or two scoping keys
using FilterEntry = std::variant<FilterValues, KeyedFilterValues, SubkeyedFilterValues>;

/// @brief Filter field name to its values
using FilterSpec = std::map<std::string, FilterEntry>;

/// @brief Input of the time-series builder
struct TimeseriesRequest {
    std::string tenant_id;
    Timestamp current_start;
    Timestamp current_end;
    Timestamp previous_start;

    std::vector<MetricSpec> series;
    FilterSpec filters;

    std::optional<std::string> group_by;
    std::optional<std::string> group_by_key;

    /// Bucket width in minutes; std::nullopt requests a single "full" bucket.
    std::optional<int64_t> granularity_minutes;
    std::optional<std::string> time_zone;
};

/// @brief Input of the filter-options (dropdown) builder
struct FilterOptionsRequest {
    std::string tenant_id;
    std::string field;
    Timestamp start;
    Timestamp end;
    std::optional<std::string> key;
    std::optional<std::string> subkey;
    std::optional<std::string> search;
    FilterSpec filters;
};

/// @brief Input of the top-documents and feedbacks builders
struct DocumentsRequest {
    std::string tenant_id;
    Timestamp start;
    Timestamp end;
    FilterSpec filters;
};

/// @brief Parameterized SQL ready for the execution layer
struct BuiltQuery {
    std::string sql;
    ParamMap params;
};

/// @brief Top-N documents statement plus the unique-document total
struct TopDocumentsQuery {
    std::string documents_sql;
    std::string total_sql;
    ParamMap params;  ///< shared by both statements
};

}  // namespace tracelens::analytics
