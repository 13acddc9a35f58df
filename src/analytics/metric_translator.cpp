#include "analytics/metric_translator.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analytics/field_map.h"
#include "common/error.h"

namespace tracelens::analytics {

namespace {

constexpr std::string_view kUserIdColumn = "Attributes['langwatch.user_id']";
constexpr std::string_view kThreadIdColumn = "Attributes['gen_ai.conversation.id']";
constexpr std::string_view kCustomerIdColumn = "Attributes['langwatch.customer_id']";
constexpr std::string_view kVoteAttribute = "'event.metrics.vote'";

// =============================================================================
// Aggregate rendering
// =============================================================================

struct AggregateCall {
    std::string function;
    std::string parameters;  ///< "(0.9)" for quantiles, empty otherwise
};

AggregateCall AggregateFor(AggKind kind, bool exact_quantile) {
    switch (kind) {
        case AggKind::kAvg: return {"avg", ""};
        case AggKind::kSum: return {"sum", ""};
        case AggKind::kMin: return {"min", ""};
        case AggKind::kMax: return {"max", ""};
        case AggKind::kCardinality:
        case AggKind::kTerms:
            return {"uniq", ""};
        case AggKind::kMedian:
        case AggKind::kP90:
        case AggKind::kP95:
        case AggKind::kP99:
            return {exact_quantile ? "quantileExact" : "quantileTDigest",
                    absl::StrCat("(", PercentileLevel(kind), ")")};
    }
    return {"avg", ""};
}

std::string ZeroIfSum(AggKind kind, std::string expression) {
    if (kind == AggKind::kSum) {
        return absl::StrCat("coalesce(", expression, ", 0)");
    }
    return expression;
}

/// agg(arg) or aggIf(arg, condition)
std::string Render(AggKind kind, std::string_view arg, bool exact_quantile = false,
                   std::string_view condition = "") {
    const AggregateCall call = AggregateFor(kind, exact_quantile);
    if (condition.empty()) {
        return ZeroIfSum(kind, absl::StrCat(call.function, call.parameters, "(", arg, ")"));
    }
    return ZeroIfSum(kind, absl::StrCat(call.function, "If", call.parameters,
                                        "(", arg, ", ", condition, ")"));
}

std::string Ts(std::string_view column) {
    return Qualify(TableId::kPrimary, column);
}

MetricTranslation Base(const MetricSpec& spec) {
    MetricTranslation t;
    t.alias = BuildMetricAlias(spec);
    return t;
}

// =============================================================================
// Trace-level metrics
// =============================================================================

/// A trace-level column and its name in the deduplicated CTE.
struct PrimaryColumn {
    std::string table_expr;
    std::string dedup_column;
    bool exact_quantile = false;
    bool skip_empty_for_distinct = false;
};

MetricTranslation TraceCount(const MetricSpec& spec) {
    MetricTranslation t = Base(spec);
    t.select_expression = "count()";
    t.dedup_expression = "uniqExact(trace_id)";
    return t;
}

MetricTranslation PrimaryAggregate(const MetricSpec& spec, const PrimaryColumn& column) {
    MetricTranslation t = Base(spec);
    const bool distinct = spec.aggregation == AggKind::kCardinality ||
                          spec.aggregation == AggKind::kTerms;

    if (distinct && column.skip_empty_for_distinct) {
        t.select_expression = Render(spec.aggregation, column.table_expr, false,
                                     absl::StrCat(column.table_expr, " != ''"));
        t.dedup_expression = Render(spec.aggregation, column.dedup_column, false,
                                    absl::StrCat(column.dedup_column, " != ''"));
    } else {
        t.select_expression = Render(spec.aggregation, column.table_expr, column.exact_quantile);
        t.dedup_expression = Render(spec.aggregation, column.dedup_column, column.exact_quantile);
    }
    return t;
}

// =============================================================================
// Child-table metrics
// =============================================================================

/// Aggregate computed per trace as a -State column of the pre-aggregated
/// join and combined with the matching -Merge in the outer query.
MetricTranslation ChildMetric(const MetricSpec& spec, TableId table, AggKind kind,
                              std::string_view arg, std::string_view condition,
                              bool array_arg, ParamMap params) {
    MetricTranslation t = Base(spec);
    const AggregateCall call = AggregateFor(kind, false);
    const std::string combinators = absl::StrCat(array_arg ? "Array" : "",
                                                 condition.empty() ? "" : "If");

    ChildAggregate child;
    child.table = table;
    child.column = absl::StrCat("m", spec.index);
    child.state_expression = absl::StrCat(
        call.function, combinators, "State", call.parameters, "(", arg,
        condition.empty() ? "" : absl::StrCat(", ", condition), ")");

    t.select_expression = ZeroIfSum(
        kind, absl::StrCat(call.function, combinators, "Merge", call.parameters, "(",
                           TableAlias(table), ".", child.column, ")"));
    t.required_joins.insert(table);
    t.child_aggregates.push_back(std::move(child));
    t.params = std::move(params);
    return t;
}

// =============================================================================
// Categories
// =============================================================================

MetricTranslation Metadata(const MetricSpec& spec) {
    if (spec.field == "metadata.trace_id") {
        MetricTranslation t = Base(spec);
        t.select_expression = Render(spec.aggregation, Ts("TraceId"));
        t.dedup_expression = (spec.aggregation == AggKind::kCardinality ||
                              spec.aggregation == AggKind::kTerms)
                                 ? std::string("uniqExact(trace_id)")
                                 : Render(spec.aggregation, "trace_id");
        return t;
    }
    if (spec.field == "metadata.user_id") {
        return PrimaryAggregate(spec, {Ts(kUserIdColumn), "user_id", false, true});
    }
    if (spec.field == "metadata.thread_id") {
        return PrimaryAggregate(spec, {Ts(kThreadIdColumn), "thread_id", false, true});
    }
    if (spec.field == "metadata.customer_id") {
        return PrimaryAggregate(spec, {Ts(kCustomerIdColumn), "customer_id", false, true});
    }
    if (spec.field == "metadata.span_type") {
        return ChildMetric(spec, TableId::kSpanChild, AggKind::kCardinality, "SpanId", "",
                           false, {});
    }
    return TraceCount(spec);
}

MetricTranslation Performance(const MetricSpec& spec) {
    if (spec.field == "performance.completion_time") {
        return PrimaryAggregate(spec, {Ts("TotalDurationMs"), "completion_time", true, false});
    }
    if (spec.field == "performance.first_token") {
        return PrimaryAggregate(spec, {Ts("TimeToFirstTokenMs"), "first_token", true, false});
    }
    if (spec.field == "performance.total_cost") {
        return PrimaryAggregate(spec, {Ts("TotalCost"), "total_cost", false, false});
    }
    if (spec.field == "performance.prompt_tokens") {
        return PrimaryAggregate(spec, {Ts("TotalPromptTokenCount"), "prompt_tokens", false, false});
    }
    if (spec.field == "performance.completion_tokens") {
        return PrimaryAggregate(spec, {Ts("TotalCompletionTokenCount"), "completion_tokens",
                                       false, false});
    }
    if (spec.field == "performance.total_tokens") {
        return PrimaryAggregate(
            spec,
            {absl::StrCat("(coalesce(", Ts("TotalPromptTokenCount"), ", 0) + coalesce(",
                          Ts("TotalCompletionTokenCount"), ", 0))"),
             "(coalesce(prompt_tokens, 0) + coalesce(completion_tokens, 0))", false, false});
    }
    if (spec.field == "performance.tokens_per_second") {
        return PrimaryAggregate(spec, {Ts("TokensPerSecond"), "tokens_per_second", false, false});
    }
    return TraceCount(spec);
}

MetricTranslation Evaluations(const MetricSpec& spec, ParamNames& names) {
    ParamMap params;
    std::vector<std::string> conditions;
    if (spec.key.has_value() && !spec.key->empty()) {
        const std::string param = names.Next("evaluatorId");
        params[param] = *spec.key;
        conditions.push_back(absl::StrCat("EvaluatorId = ", Placeholder(param, "String")));
    }

    if (spec.field == "evaluations.evaluation_score" ||
        spec.field == "evaluations.evaluation_pass_rate") {
        conditions.push_back("Status = 'processed'");
        const std::string arg = spec.field == "evaluations.evaluation_score"
                                    ? std::string("Score")
                                    : std::string("toFloat64(Passed)");
        return ChildMetric(spec, TableId::kEvalChild, spec.aggregation, arg,
                           absl::StrJoin(conditions, " AND "), false, std::move(params));
    }
    if (spec.field == "evaluations.evaluation_runs") {
        return ChildMetric(spec, TableId::kEvalChild, AggKind::kCardinality, "EvaluationId",
                           absl::StrJoin(conditions, " AND "), false, std::move(params));
    }
    return TraceCount(spec);
}

/// Numeric values of one attribute across the events of a span, optionally
/// restricted to one event name.
std::string EventValues(std::string_view attribute, const std::optional<std::string>& event_name) {
    const std::string name_condition =
        event_name.has_value() ? absl::StrCat("name = ", *event_name, " AND ") : std::string();
    return absl::StrCat(
        "arrayMap(attrs -> toFloat64OrNull(attrs[", attribute, "]), ",
        "arrayFilter((attrs, name) -> ", name_condition, "mapContains(attrs, ", attribute,
        "), \"Events.Attributes\", \"Events.Name\"))");
}

absl::StatusOr<MetricTranslation> Events(const MetricSpec& spec, ParamNames& names) {
    if (spec.field == "events.event_details") {
        return UnsupportedMetricError(spec.field);
    }

    if (spec.field == "events.event_type") {
        if (spec.key.has_value() && !spec.key->empty()) {
            const std::string param = names.Next("eventType");
            return ChildMetric(spec, TableId::kSpanChild, AggKind::kSum,
                               absl::StrCat("arrayCount(name -> name = ",
                                            Placeholder(param, "String"), ", \"Events.Name\")"),
                               "", false, {{param, *spec.key}});
        }
        return ChildMetric(spec, TableId::kSpanChild, AggKind::kSum, "length(\"Events.Name\")",
                           "", false, {});
    }

    if (spec.field == "events.event_score") {
        if (!spec.subkey.has_value() || spec.subkey->empty()) {
            return TraceCount(spec);
        }
        ParamMap params;
        const std::string key_param = names.Next("metricKey");
        params[key_param] = absl::StrCat("event.metrics.", *spec.subkey);

        std::optional<std::string> event_name;
        if (spec.key.has_value() && !spec.key->empty()) {
            const std::string type_param = names.Next("eventType");
            params[type_param] = *spec.key;
            event_name = Placeholder(type_param, "String");
        }
        return ChildMetric(spec, TableId::kSpanChild, spec.aggregation,
                           EventValues(Placeholder(key_param, "String"), event_name), "",
                           true, std::move(params));
    }

    return TraceCount(spec);
}

MetricTranslation Sentiment(const MetricSpec& spec) {
    if (spec.field == "sentiment.input_sentiment") {
        return PrimaryAggregate(
            spec, {absl::StrCat("toFloat64OrNull(",
                                Ts("Attributes['langwatch.input.satisfaction_score']"), ")"),
                   "input_sentiment", false, false});
    }
    if (spec.field == "sentiment.thumbs_up_down") {
        return ChildMetric(spec, TableId::kSpanChild, spec.aggregation,
                           EventValues(kVoteAttribute, std::string("'thumbs_up_down'")), "",
                           true, {});
    }
    return TraceCount(spec);
}

std::string ThreadDuration() {
    return absl::StrCat("least(dateDiff('millisecond', min(", Ts("CreatedAt"), "), max(",
                        Ts("CreatedAt"), ")), ", kMaxThreadDurationMs, ")");
}

MetricTranslation Threads(const MetricSpec& spec) {
    if (spec.field != "threads.average_duration_per_thread") {
        return TraceCount(spec);
    }

    SubqueryDescriptor subquery;
    subquery.inner_select = absl::StrCat(Ts(kThreadIdColumn), " AS thread_id, ",
                                         ThreadDuration(), " AS thread_duration");
    subquery.inner_group_by = "thread_id";
    subquery.inner_filter = absl::StrCat(Ts(kThreadIdColumn), " != ''");
    subquery.outer_aggregation = Render(spec.aggregation, "thread_duration");

    MetricTranslation t = Base(spec);
    t.select_expression = subquery.outer_aggregation;
    t.requires_subquery = true;
    t.subquery = std::move(subquery);
    return t;
}

/// Name of the deduplicated CTE column carrying a trace-level expression.
std::optional<std::string> DedupColumnFor(std::string_view table_expr) {
    for (const auto& [name, expression] : DedupCarriedColumns()) {
        if (expression == table_expr) {
            return name;
        }
    }
    return std::nullopt;
}

/// Metrics outside the known categories go through the field map. Numeric
/// columns take the requested aggregate, other scalar columns only a
/// distinct count; everything else counts traces.
MetricTranslation Direct(const MetricSpec& spec) {
    const FieldMapping* mapping = FindFieldMapping(spec.field);
    if (mapping == nullptr || mapping->is_array_valued) {
        return TraceCount(spec);
    }
    const bool distinct = spec.aggregation == AggKind::kCardinality ||
                          spec.aggregation == AggKind::kTerms;
    if (!mapping->is_numeric && !distinct) {
        return TraceCount(spec);
    }

    if (mapping->table != TableId::kPrimary) {
        std::string arg = mapping->column_expr;
        if (mapping->map_value_kind == MapValueKind::kNumber) {
            arg = absl::StrCat("toFloat64OrNull(", arg, ")");
        }
        return ChildMetric(spec, mapping->table, spec.aggregation, arg,
                           mapping->is_numeric ? "" : absl::StrCat(arg, " != ''"), false, {});
    }

    std::string table_expr = Ts(mapping->column_expr);
    if (mapping->map_value_kind == MapValueKind::kNumber) {
        table_expr = absl::StrCat("toFloat64OrNull(", table_expr, ")");
    }
    const std::optional<std::string> dedup_column = DedupColumnFor(table_expr);
    MetricTranslation t = PrimaryAggregate(
        spec, {table_expr, dedup_column.value_or(""), false, !mapping->is_numeric});
    if (!dedup_column.has_value()) {
        t.dedup_expression.reset();
    }
    return t;
}

std::string PipelineColumn(std::string_view field) {
    if (field == "user_id") return Ts(kUserIdColumn);
    if (field == "thread_id") return Ts(kThreadIdColumn);
    if (field == "customer_id") return Ts(kCustomerIdColumn);
    return Ts("TraceId");
}

}  // namespace

std::string MetricTranslation::SelectWithAlias() const {
    return absl::StrCat(select_expression, " AS ", QuoteIdentifier(alias));
}

MetricCategory CategoryOf(std::string_view field) {
    const std::string_view prefix = field.substr(0, field.find('.'));
    if (prefix == "metadata") return MetricCategory::kMetadata;
    if (prefix == "performance") return MetricCategory::kPerformance;
    if (prefix == "evaluations") return MetricCategory::kEvaluations;
    if (prefix == "events") return MetricCategory::kEvents;
    if (prefix == "sentiment") return MetricCategory::kSentiment;
    if (prefix == "threads") return MetricCategory::kThreads;
    return MetricCategory::kUnknown;
}

std::string BuildMetricAlias(const MetricSpec& spec) {
    std::vector<std::string> parts = {
        absl::StrCat(spec.index),
        SanitizeIdentifier(spec.field),
        std::string(AggKindName(spec.aggregation)),
    };
    if (spec.key.has_value() && !spec.key->empty()) {
        parts.push_back(SanitizeIdentifier(*spec.key));
    }
    if (spec.subkey.has_value() && !spec.subkey->empty()) {
        parts.push_back(SanitizeIdentifier(*spec.subkey));
    }
    return absl::StrJoin(parts, "__");
}

bool RequiresSubquery(const MetricSpec& spec) {
    return spec.pipeline.has_value() || spec.field == "threads.average_duration_per_thread";
}

absl::StatusOr<MetricTranslation> TranslateMetric(const MetricSpec& spec, ParamNames& names) {
    switch (CategoryOf(spec.field)) {
        case MetricCategory::kMetadata:
            return Metadata(spec);
        case MetricCategory::kPerformance:
            return Performance(spec);
        case MetricCategory::kEvaluations:
            return Evaluations(spec, names);
        case MetricCategory::kEvents:
            return Events(spec, names);
        case MetricCategory::kSentiment:
            return Sentiment(spec);
        case MetricCategory::kThreads:
            return Threads(spec);
        case MetricCategory::kUnknown:
            return Direct(spec);
    }
    return TraceCount(spec);
}

absl::StatusOr<MetricTranslation> TranslatePipeline(const MetricSpec& spec, ParamNames& names) {
    if (!spec.pipeline.has_value()) {
        return InvalidArgumentError(
            absl::StrCat("Series '", spec.field, "' has no pipeline to translate"));
    }
    TRACELENS_ASSIGN_OR_RETURN(MetricTranslation inner, TranslateMetric(spec, names));

    const std::string& bucket_field = spec.pipeline->field;
    const std::string bucket_column = PipelineColumn(bucket_field);
    const bool bucket_is_trace = bucket_column == Ts("TraceId");

    MetricTranslation t = Base(spec);
    t.required_joins = inner.required_joins;
    t.child_aggregates = inner.child_aggregates;
    t.params = inner.params;
    t.requires_subquery = true;

    SubqueryDescriptor subquery;
    subquery.outer_aggregation = Render(spec.pipeline->aggregation, "inner_value");
    subquery.inner_group_by = "pipeline_key";

    if (inner.requires_subquery) {
        // Per (bucket, thread) duration, then the metric per bucket, then the
        // pipeline aggregation across buckets.
        NestedLevel nested;
        nested.select = absl::StrCat(bucket_column, " AS pipeline_key, ", Ts(kThreadIdColumn),
                                     " AS thread_id, ", ThreadDuration(), " AS thread_duration");
        nested.group_by = "pipeline_key, thread_id";
        subquery.nested = std::move(nested);
        subquery.inner_select = absl::StrCat(
            "pipeline_key, ", Render(spec.aggregation, "thread_duration"), " AS inner_value");
        subquery.inner_filter = absl::StrCat(Ts(kThreadIdColumn), " != ''");
    } else {
        subquery.inner_select = absl::StrCat(bucket_column, " AS pipeline_key, ",
                                             inner.select_expression, " AS inner_value");
    }
    if (!bucket_is_trace) {
        const std::string non_empty = absl::StrCat(bucket_column, " != ''");
        subquery.inner_filter = subquery.inner_filter.empty()
                                    ? non_empty
                                    : absl::StrCat(subquery.inner_filter, " AND ", non_empty);
    }

    t.select_expression = subquery.outer_aggregation;
    t.subquery = std::move(subquery);
    return t;
}

absl::StatusOr<MetricTranslation> TranslateSeries(const MetricSpec& spec, ParamNames& names) {
    if (spec.pipeline.has_value()) {
        return TranslatePipeline(spec, names);
    }
    return TranslateMetric(spec, names);
}

const std::vector<std::pair<std::string, std::string>>& DedupCarriedColumns() {
    static const std::vector<std::pair<std::string, std::string>> columns = {
        {"user_id", Ts(kUserIdColumn)},
        {"thread_id", Ts(kThreadIdColumn)},
        {"customer_id", Ts(kCustomerIdColumn)},
        {"total_cost", Ts("TotalCost")},
        {"completion_time", Ts("TotalDurationMs")},
        {"first_token", Ts("TimeToFirstTokenMs")},
        {"prompt_tokens", Ts("TotalPromptTokenCount")},
        {"completion_tokens", Ts("TotalCompletionTokenCount")},
        {"tokens_per_second", Ts("TokensPerSecond")},
        {"input_sentiment",
         absl::StrCat("toFloat64OrNull(", Ts("Attributes['langwatch.input.satisfaction_score']"), ")")},
        {"topic_id", Ts("TopicId")},
        {"subtopic_id", Ts("SubTopicId")},
        {"has_error", Ts("ContainsErrorStatus")},
        {"has_annotation", Ts("HasAnnotation")},
    };
    return columns;
}

}  // namespace tracelens::analytics
