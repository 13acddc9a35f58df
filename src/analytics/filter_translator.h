#pragma once

/// @file filter_translator.h
/// @brief Translation of filter selections into WHERE-clause fragments

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "analytics/sql_builder.h"
#include "analytics/types.h"

namespace tracelens::analytics {

/// @brief Filter fields understood by the translator
enum class FilterField {
    kTopics,
    kSubtopics,
    kUserId,
    kThreadId,
    kCustomerId,
    kLabels,
    kMetadataKey,
    kMetadataValue,
    kPromptIds,
    kTraceError,
    kSpanType,
    kSpanModel,
    kEvaluatorId,
    kEvaluatorIdGuardrailsOnly,
    kEvaluationPassed,
    kEvaluationScore,
    kEvaluationLabel,
    kEvaluationState,
    kEventType,
    kEventMetricKey,
    kEventMetricValue,
    kEventDetailKey,
    kHasAnnotation,
};

std::optional<FilterField> ParseFilterField(std::string_view name);
std::string_view FilterFieldName(FilterField field);

/// @brief WHERE fragment produced for one or more filters
struct FilterTranslation {
    std::string where_clause = "1=1";
    std::set<TableId> required_joins;
    ParamMap params;
    bool uses_exists_subquery = false;

    bool IsTrivial() const { return IsTrivialCondition(where_clause); }
};

/// Prefix under which event metric values are stored in Events.Attributes.
inline constexpr std::string_view kEventMetricPrefix = "event.metrics.";
/// Prefix under which event details are stored in Events.Attributes.
inline constexpr std::string_view kEventDetailPrefix = "event.details.";

/// @brief Translate one filter
///
/// Empty values and unknown fields yield the trivial "1=1". Range filters
/// (evaluations.score, events.metrics.value) need exactly two finite numbers
/// and fail with InvalidArgument otherwise.
absl::StatusOr<FilterTranslation> TranslateFilter(
    std::string_view field,
    const std::vector<std::string>& values,
    const std::optional<std::string>& key,
    const std::optional<std::string>& subkey,
    ParamNames& names);

/// @brief AND the non-trivial fragments together and merge joins and params
FilterTranslation CombineFilters(const std::vector<FilterTranslation>& translations);

/// @brief Translate and combine every entry of a filter selection
absl::StatusOr<FilterTranslation> TranslateAllFilters(const FilterSpec& filters,
                                                      ParamNames& names);

}  // namespace tracelens::analytics
