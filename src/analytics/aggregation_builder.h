#pragma once

/// @file aggregation_builder.h
/// @brief Entry point of the analytics query compiler
///
/// AggregationBuilder turns a TimeseriesRequest into one parameterized
/// ClickHouse statement. Both comparison periods are computed in a single
/// statement and tagged with a `period` column ('current' or 'previous').
///
/// The statement takes one of four shapes:
///   - kBucketedSeries: one GROUP BY over period (and date / group_key)
///   - kDedupGrouping:  a DISTINCT (trace, group key) CTE first, for group
///                      keys that are multi-valued per trace or live on a
///                      child table
///   - kSummary:        granularity "full"; one CTE per period so that both
///                      periods always produce a row
///   - kSubquery:       kSummary plus one CTE per period for every metric that
///                      needs two or three aggregation levels. With a group
///                      key that needs no child-table join, every CTE is
///                      also grouped by it.
///
/// The builder also offers the filter-options, top-documents and feedbacks
/// statements, which do not go through the shape selection.

#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "analytics/types.h"
#include "common/config.h"

namespace tracelens::analytics {

/// @brief Tunables of the compiler (config keys under "analytics.")
struct CompilerOptions {
    std::string default_time_zone = "UTC";
    int64_t max_buckets = 1000;
    int64_t max_filter_options = 10000;
    int64_t top_documents_limit = 10;
    int64_t feedbacks_limit = 100;

    /// @brief Read the options, keeping defaults for absent keys
    static CompilerOptions FromConfig(const Config& config);
};

enum class QueryShape {
    kBucketedSeries,
    kDedupGrouping,
    kSummary,
    kSubquery,
};

std::string_view QueryShapeName(QueryShape shape);

/// @brief True for group-by fields that need the deduplicated shape
bool GroupingNeedsDedup(std::string_view group_by);

/// @brief True for group-by fields whose key is read through a child-table join
bool GroupingJoinsChildTable(std::string_view group_by);

class AggregationBuilder {
public:
    explicit AggregationBuilder(CompilerOptions options = {});

    /// @brief Shape the time-series statement will take for this request
    static QueryShape SelectQueryShape(const TimeseriesRequest& request);

    /// @brief Compile a time-series request
    ///
    /// Fails with InvalidArgument for an inconsistent request or a malformed
    /// range filter, and with an unsupported-metric status (see
    /// IsUnsupportedMetric) for metrics the SQL backend cannot compute.
    absl::StatusOr<BuiltQuery> BuildTimeseriesQuery(const TimeseriesRequest& request) const;

    /// @brief Distinct values of one filter field with their trace counts
    absl::StatusOr<BuiltQuery> BuildFilterOptionsQuery(const FilterOptionsRequest& request) const;

    /// @brief Most retrieved RAG documents plus the number of unique documents
    absl::StatusOr<TopDocumentsQuery> BuildTopDocumentsQuery(const DocumentsRequest& request) const;

    /// @brief Newest thumbs up/down feedback events
    absl::StatusOr<BuiltQuery> BuildFeedbacksQuery(const DocumentsRequest& request) const;

    const CompilerOptions& options() const { return options_; }

private:
    CompilerOptions options_;
};

}  // namespace tracelens::analytics
