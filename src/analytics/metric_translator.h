#pragma once

/// @file metric_translator.h
/// @brief Translation of metric series into aggregate SQL expressions
///
/// Metrics are routed by category (the first segment of the field path).
/// Metrics over a child table are computed per trace in a pre-aggregated
/// join (one row per trace, -State combinators) and merged in the outer
/// query, so joining a child table never multiplies trace-level values.

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "analytics/sql_builder.h"
#include "analytics/types.h"

namespace tracelens::analytics {

/// @brief Metric families, keyed by the field's first path segment
enum class MetricCategory {
    kMetadata,
    kPerformance,
    kEvaluations,
    kEvents,
    kSentiment,
    kThreads,
    kUnknown,
};

MetricCategory CategoryOf(std::string_view field);

/// Upper bound applied to each thread's duration before averaging (4 hours).
inline constexpr int64_t kMaxThreadDurationMs = 4LL * 60 * 60 * 1000;

/// @brief Per-trace partial aggregate over a child table
struct ChildAggregate {
    TableId table = TableId::kSpanChild;
    std::string column;            ///< column name inside the pre-aggregated join
    std::string state_expression;  ///< e.g. avgIfState(Score, Status = 'processed')
};

/// @brief Innermost level of a three-level aggregation
struct NestedLevel {
    std::string select;
    std::string group_by;
};

/// @brief Inner aggregation chain beneath an outer aggregate
///
/// The level that reads the source table is the nested level when present,
/// otherwise the inner level; inner_filter applies there.
struct SubqueryDescriptor {
    std::string inner_select;
    std::string inner_group_by;
    std::string inner_filter;
    std::string outer_aggregation;  ///< reads the inner level's columns
    std::optional<NestedLevel> nested;
};

/// @brief Translation of one metric series
struct MetricTranslation {
    std::string select_expression;  ///< aggregate over ts and the pre-aggregated joins
    std::string alias;
    std::set<TableId> required_joins;
    std::vector<ChildAggregate> child_aggregates;
    ParamMap params;

    /// Aggregate over the deduplicated grouping CTE, when the metric only
    /// needs trace-level columns.
    std::optional<std::string> dedup_expression;

    bool requires_subquery = false;
    std::optional<SubqueryDescriptor> subquery;

    /// "<select_expression> AS `<alias>`"
    std::string SelectWithAlias() const;
};

/// @brief "<index>__<field>__<agg>[__<key>][__<subkey>]" restricted to [A-Za-z0-9_]
std::string BuildMetricAlias(const MetricSpec& spec);

/// @brief True when the series needs the per-period CTE shape
bool RequiresSubquery(const MetricSpec& spec);

/// @brief Translate a series, ignoring any pipeline
///
/// Unknown fields fall back to a trace count. events.event_details fails
/// with an unsupported-metric error.
absl::StatusOr<MetricTranslation> TranslateMetric(const MetricSpec& spec, ParamNames& names);

/// @brief Translate a series wrapped in its pipeline aggregation
absl::StatusOr<MetricTranslation> TranslatePipeline(const MetricSpec& spec, ParamNames& names);

/// @brief TranslatePipeline when spec.pipeline is set, TranslateMetric otherwise
absl::StatusOr<MetricTranslation> TranslateSeries(const MetricSpec& spec, ParamNames& names);

/// @brief Trace-level columns carried into the deduplicated grouping CTE
///        as (column name, expression over ts)
const std::vector<std::pair<std::string, std::string>>& DedupCarriedColumns();

}  // namespace tracelens::analytics
