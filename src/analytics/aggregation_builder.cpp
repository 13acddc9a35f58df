#include "analytics/aggregation_builder.h"

#include <optional>
#include <set>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analytics/field_map.h"
#include "analytics/filter_translator.h"
#include "analytics/metric_translator.h"
#include "analytics/sql_builder.h"
#include "analytics/time_bucket.h"
#include "common/error.h"
#include "common/logging.h"

namespace tracelens::analytics {

namespace {

constexpr std::string_view kVoteAttribute = "'event.metrics.vote'";

// =============================================================================
// Grouping
// =============================================================================

enum class GroupKeyMode {
    kNormalize,  ///< empty or NULL becomes 'unknown'
    kBoolean,    ///< 0/1 used as is
    kLabel,      ///< expression always yields a label
    kRaw,        ///< unnested values; empty keys removed by HAVING
};

struct Grouping {
    std::string expression;
    std::set<TableId> joins;  ///< plain child joins, deduplicated shape only
    bool needs_dedup = false;
    GroupKeyMode mode = GroupKeyMode::kNormalize;
    std::string extra_condition;
    ParamMap params;
};

std::string Ts(std::string_view column) {
    return Qualify(TableId::kPrimary, column);
}

std::string Ss(std::string_view column) {
    return Qualify(TableId::kSpanChild, column);
}

std::string Es(std::string_view column) {
    return Qualify(TableId::kEvalChild, column);
}

Grouping Bucketed(std::string expression, GroupKeyMode mode = GroupKeyMode::kNormalize) {
    Grouping g;
    g.expression = std::move(expression);
    g.mode = mode;
    return g;
}

Grouping Deduped(std::string expression, GroupKeyMode mode, std::set<TableId> joins = {}) {
    Grouping g;
    g.expression = std::move(expression);
    g.mode = mode;
    g.needs_dedup = true;
    g.joins = std::move(joins);
    return g;
}

Grouping EvaluationGrouping(std::string_view column, GroupKeyMode mode,
                            const std::optional<std::string>& evaluator_id, ParamNames& names) {
    Grouping g = Deduped(Es(column), mode, {TableId::kEvalChild});
    if (evaluator_id.has_value() && !evaluator_id->empty()) {
        const std::string param = names.Next("groupEvaluatorId");
        g.params[param] = *evaluator_id;
        g.extra_condition = absl::StrCat(Es("EvaluatorId"), " = ", Placeholder(param, "String"));
    } else {
        g.extra_condition = absl::StrCat(Es("EvaluationId"), " != ''");
    }
    return g;
}

Grouping ResolveGrouping(std::string_view group_by, const std::optional<std::string>& group_by_key,
                         ParamNames& names) {
    if (group_by == "topics.topics") return Bucketed(Ts("TopicId"));
    if (group_by == "topics.subtopics") return Bucketed(Ts("SubTopicId"));
    if (group_by == "metadata.user_id") return Bucketed(Ts("Attributes['langwatch.user_id']"));
    if (group_by == "metadata.thread_id") return Bucketed(Ts("Attributes['gen_ai.conversation.id']"));
    if (group_by == "metadata.customer_id") return Bucketed(Ts("Attributes['langwatch.customer_id']"));
    if (group_by == "sentiment.input_sentiment") {
        const std::string score =
            absl::StrCat("toFloat64OrNull(", Ts("Attributes['langwatch.input.satisfaction_score']"), ")");
        return Bucketed(absl::StrCat("multiIf(", score, " >= 0.1, 'positive', ", score,
                                     " <= -0.1, 'negative', 'neutral')"),
                        GroupKeyMode::kLabel);
    }
    if (group_by == "error.has_error" || group_by == "traces.error") {
        return Bucketed(absl::StrCat("if(", Ts("ContainsErrorStatus"),
                                     " = 1, 'with error', 'without error')"),
                        GroupKeyMode::kLabel);
    }

    if (group_by == "metadata.labels") {
        return Deduped(absl::StrCat("arrayJoin(arrayDistinct(JSONExtract(",
                                    Ts("Attributes['langwatch.labels']"), ", 'Array(String)')))"),
                       GroupKeyMode::kRaw);
    }
    if (group_by == "metadata.model") {
        return Deduped(absl::StrCat("arrayJoin(arrayDistinct(", Ts("Models"), "))"),
                       GroupKeyMode::kRaw);
    }
    if (group_by == "metadata.span_type") {
        return Deduped(Ss("SpanAttributes['langwatch.span.type']"), GroupKeyMode::kNormalize,
                       {TableId::kSpanChild});
    }
    if (group_by == "events.event_type") {
        return Deduped(absl::StrCat("arrayJoin(", Ss("\"Events.Name\""), ")"), GroupKeyMode::kRaw,
                       {TableId::kSpanChild});
    }
    if (group_by == "sentiment.thumbs_up_down") {
        return Deduped(
            absl::StrCat("arrayJoin(arrayMap(attrs -> attrs[", kVoteAttribute, "], ",
                         "arrayFilter((attrs, name) -> name = 'thumbs_up_down' AND mapContains(attrs, ",
                         kVoteAttribute, "), ", Ss("\"Events.Attributes\""), ", ",
                         Ss("\"Events.Name\""), ")))"),
            GroupKeyMode::kRaw, {TableId::kSpanChild});
    }
    if (group_by == "evaluations.evaluation_passed") {
        return EvaluationGrouping("Passed", GroupKeyMode::kBoolean, group_by_key, names);
    }
    if (group_by == "evaluations.evaluation_label") {
        return EvaluationGrouping("Label", GroupKeyMode::kNormalize, group_by_key, names);
    }
    if (group_by == "evaluations.evaluation_processing_state") {
        return EvaluationGrouping("Status", GroupKeyMode::kNormalize, group_by_key, names);
    }

    TRACELENS_LOG_DEBUG("Unknown group-by field '{}', grouping by trace id", group_by);
    return Bucketed(Ts("TraceId"));
}

std::string GroupKeyExpression(const Grouping& grouping) {
    if (grouping.mode == GroupKeyMode::kNormalize) {
        return absl::StrCat("if(", grouping.expression, " = '' OR ", grouping.expression,
                            " IS NULL, 'unknown', ", grouping.expression, ") AS group_key");
    }
    return absl::StrCat(grouping.expression, " AS group_key");
}

// =============================================================================
// Shared fragments
// =============================================================================

std::string WindowCondition(std::string_view start_param, std::string_view end_param) {
    return absl::StrCat(Ts("CreatedAt"), " >= ", Placeholder(start_param, "DateTime64(3)"),
                        " AND ", Ts("CreatedAt"), " < ", Placeholder(end_param, "DateTime64(3)"));
}

std::string BothWindowsCondition() {
    return absl::StrCat("((", WindowCondition("currentStart", "currentEnd"), ") OR (",
                        WindowCondition("previousStart", "previousEnd"), "))");
}

std::string PeriodExpression() {
    return absl::StrCat("CASE WHEN ", WindowCondition("currentStart", "currentEnd"),
                        " THEN 'current' WHEN ", WindowCondition("previousStart", "previousEnd"),
                        " THEN 'previous' END AS period");
}

/// One row per trace of a child table holding the -State columns of every
/// metric that needs it. Joined with the fixed child join predicate, or on
/// trace_column when the outer query does not read ts.
std::string AggregatedChildJoin(TableId table, const std::vector<ChildAggregate>& aggregates,
                                std::string_view start_param, std::string_view end_param,
                                std::string_view trace_column) {
    SelectBuilder window;
    window.Select("TraceId")
        .From(std::string(TableName(TableId::kPrimary)))
        .Where(absl::StrCat("TenantId = ", Placeholder("tenantId", "String")))
        .Where(absl::StrCat("CreatedAt >= ", Placeholder(start_param, "DateTime64(3)")))
        .Where(absl::StrCat("CreatedAt < ", Placeholder(end_param, "DateTime64(3)")));

    SelectBuilder per_trace;
    per_trace.Select("TenantId").Select("TraceId");
    for (const auto& aggregate : aggregates) {
        if (aggregate.table == table) {
            per_trace.Select(absl::StrCat(aggregate.state_expression, " AS ", aggregate.column));
        }
    }
    per_trace.From(std::string(TableName(table)))
        .Where(absl::StrCat("TenantId = ", Placeholder("tenantId", "String")))
        .Where(absl::StrCat("TraceId IN (", window.Build(), ")"))
        .GroupBy("TenantId")
        .GroupBy("TraceId");

    const std::string on = trace_column.empty()
                               ? JoinPredicate(table)
                               : absl::StrCat(TableAlias(table), ".TraceId = ", trace_column);
    return absl::StrCat("LEFT JOIN (\n", per_trace.Build(), "\n) AS ", TableAlias(table),
                        " ON ", on);
}

void AddChildJoins(SelectBuilder& query, const std::vector<const MetricTranslation*>& metrics,
                   std::string_view start_param, std::string_view end_param,
                   std::string_view trace_column = "") {
    std::vector<ChildAggregate> aggregates;
    std::set<TableId> tables;
    for (const auto* metric : metrics) {
        aggregates.insert(aggregates.end(), metric->child_aggregates.begin(),
                          metric->child_aggregates.end());
        tables.insert(metric->required_joins.begin(), metric->required_joins.end());
    }
    for (TableId table : tables) {
        if (table != TableId::kPrimary) {
            query.Join(AggregatedChildJoin(table, aggregates, start_param, end_param,
                                           trace_column));
        }
    }
}

void MergeParams(ParamMap& into, const ParamMap& from) {
    for (const auto& [name, value] : from) {
        into[name] = value;
    }
}

void WarnDropped(const MetricTranslation& metric, std::string_view reason) {
    TRACELENS_LOG_WARN("Dropping metric {}: {}", metric.alias, reason);
}

/// Period value of an aggregate that may be missing (no row) or not finite
/// (avg and quantiles over no rows).
std::string ZeroIfEmpty(std::string_view expression) {
    return absl::StrCat("ifNotFinite(coalesce(", expression, ", 0), 0)");
}

// =============================================================================
// Shapes
// =============================================================================

struct ShapeInput {
    std::vector<MetricTranslation> metrics;
    FilterTranslation filter;
    std::optional<Grouping> grouping;
    std::optional<std::string> date_expression;
};

std::string BuildBucketed(const ShapeInput& in, ParamMap& params) {
    SelectBuilder query;
    query.Select(PeriodExpression());
    if (in.date_expression.has_value()) {
        query.Select(absl::StrCat(*in.date_expression, " AS date"));
    }
    if (in.grouping.has_value()) {
        query.Select(GroupKeyExpression(*in.grouping));
    }

    std::vector<const MetricTranslation*> kept;
    for (const auto& metric : in.metrics) {
        if (metric.requires_subquery) {
            WarnDropped(metric, "two-level aggregation needs granularity 'full'");
            continue;
        }
        query.Select(metric.SelectWithAlias());
        MergeParams(params, metric.params);
        kept.push_back(&metric);
    }

    query.From(PrimaryTableSource("previousStart", "currentEnd"));
    AddChildJoins(query, kept, "previousStart", "currentEnd");
    query.Where(BothWindowsCondition()).Where(in.filter.where_clause);

    query.GroupBy("period");
    query.OrderBy("period");
    if (in.date_expression.has_value()) {
        query.GroupBy("date");
        query.OrderBy("date");
    }
    if (in.grouping.has_value()) {
        query.GroupBy("group_key");
    }
    return query.Build();
}

std::string BuildDedupGrouping(const ShapeInput& in, ParamMap& params) {
    const Grouping& grouping = *in.grouping;

    SelectBuilder deduped;
    deduped.Distinct()
        .Select(absl::StrCat(Ts("TraceId"), " AS trace_id"))
        .Select(GroupKeyExpression(grouping))
        .Select(PeriodExpression());
    if (in.date_expression.has_value()) {
        deduped.Select(absl::StrCat(*in.date_expression, " AS date"));
    }
    for (const auto& [name, expression] : DedupCarriedColumns()) {
        deduped.Select(absl::StrCat(expression, " AS ", name));
    }
    deduped.From(PrimaryTableSource("previousStart", "currentEnd"));
    for (TableId table : grouping.joins) {
        deduped.Join(JoinClause(table));
    }
    deduped.Where(BothWindowsCondition())
        .Where(in.filter.where_clause)
        .Where(grouping.extra_condition);
    MergeParams(params, grouping.params);

    SelectBuilder query;
    query.With("deduped", deduped.Build()).Select("period");
    if (in.date_expression.has_value()) {
        query.Select("date");
    }
    query.Select("group_key");

    // Child-table metrics read their per-trace states joined on trace_id, so
    // each trace still counts once per group.
    std::vector<const MetricTranslation*> joined;
    for (const auto& metric : in.metrics) {
        if (metric.requires_subquery) {
            WarnDropped(metric,
                        in.date_expression.has_value()
                            ? "two-level aggregation needs granularity 'full'"
                            : "two-level aggregation is not computed for child-table groupings");
            continue;
        }
        if (metric.dedup_expression.has_value()) {
            query.Select(
                absl::StrCat(*metric.dedup_expression, " AS ", QuoteIdentifier(metric.alias)));
        } else if (!metric.child_aggregates.empty()) {
            query.Select(metric.SelectWithAlias());
            joined.push_back(&metric);
        } else {
            WarnDropped(metric, "no form over deduplicated groups");
            continue;
        }
        MergeParams(params, metric.params);
    }

    query.From("deduped");
    AddChildJoins(query, joined, "previousStart", "currentEnd", "deduped.trace_id");
    query.GroupBy("period");
    if (in.date_expression.has_value()) {
        query.GroupBy("date");
    }
    query.GroupBy("group_key");
    if (grouping.mode == GroupKeyMode::kRaw) {
        query.Having("group_key != ''");
    }
    query.OrderBy("period");
    if (in.date_expression.has_value()) {
        query.OrderBy("date");
    }
    return query.Build();
}

/// Source-reading level of a subquery metric restricted to one period.
/// With a grouping, every level also carries and groups by group_key.
std::string SubqueryChain(const MetricTranslation& metric, const FilterTranslation& filter,
                          std::string_view start_param, std::string_view end_param,
                          const Grouping* grouping = nullptr) {
    const SubqueryDescriptor& sub = *metric.subquery;

    SelectBuilder source_level;
    source_level.From(PrimaryTableSource(start_param, end_param));
    AddChildJoins(source_level, {&metric}, start_param, end_param);
    source_level.Where(WindowCondition(start_param, end_param))
        .Where(filter.where_clause)
        .Where(sub.inner_filter);
    if (grouping != nullptr) {
        source_level.Select(GroupKeyExpression(*grouping)).Where(grouping->extra_condition);
    }

    std::string inner;
    if (sub.nested.has_value()) {
        source_level.Select(sub.nested->select).GroupBy(sub.nested->group_by);
        SelectBuilder inner_level;
        if (grouping != nullptr) {
            source_level.GroupBy("group_key");
            inner_level.Select("group_key");
        }
        inner_level.Select(sub.inner_select)
            .From(absl::StrCat("(\n", source_level.Build(), "\n)"))
            .GroupBy(sub.inner_group_by);
        if (grouping != nullptr) {
            inner_level.GroupBy("group_key");
        }
        inner = inner_level.Build();
    } else {
        source_level.Select(sub.inner_select).GroupBy(sub.inner_group_by);
        if (grouping != nullptr) {
            source_level.GroupBy("group_key");
        }
        inner = source_level.Build();
    }

    SelectBuilder outer;
    if (grouping != nullptr) {
        outer.Select("group_key");
    }
    outer.Select(absl::StrCat(sub.outer_aggregation, " AS value"))
        .From(absl::StrCat("(\n", inner, "\n)"));
    if (grouping != nullptr) {
        outer.GroupBy("group_key");
        if (grouping->mode == GroupKeyMode::kRaw) {
            outer.Where("group_key != ''");
        }
    }
    return outer.Build();
}

struct Period {
    std::string_view name;
    std::string_view start_param;
    std::string_view end_param;
};

constexpr Period kPeriods[] = {
    {"current", "currentStart", "currentEnd"},
    {"previous", "previousStart", "previousEnd"},
};

std::string BuildPerPeriod(const ShapeInput& in, ParamMap& params) {
    std::vector<const MetricTranslation*> simple;
    for (const auto& metric : in.metrics) {
        MergeParams(params, metric.params);
        if (!metric.requires_subquery) {
            simple.push_back(&metric);
        }
    }

    SelectBuilder query;
    std::vector<std::string> rows;

    for (const Period& period : kPeriods) {
        const std::string simple_cte = absl::StrCat("simple_metrics_", period.name);
        if (!simple.empty()) {
            SelectBuilder cte;
            for (const auto* metric : simple) {
                cte.Select(metric->SelectWithAlias());
            }
            cte.From(PrimaryTableSource(period.start_param, period.end_param));
            AddChildJoins(cte, simple, period.start_param, period.end_param);
            cte.Where(WindowCondition(period.start_param, period.end_param))
                .Where(in.filter.where_clause);
            query.With(simple_cte, cte.Build());
        }

        SelectBuilder row;
        row.Select(absl::StrCat("'", period.name, "' AS period"));
        for (const auto& metric : in.metrics) {
            const std::string column = QuoteIdentifier(metric.alias);
            if (metric.requires_subquery) {
                const std::string cte_name =
                    absl::StrCat("cte_", SanitizeIdentifier(metric.alias), "_", period.name);
                query.With(cte_name, SubqueryChain(metric, in.filter, period.start_param,
                                                   period.end_param));
                row.Select(absl::StrCat(
                    ZeroIfEmpty(absl::StrCat("(SELECT value FROM ", cte_name, ")")), " AS ",
                    column));
            } else {
                row.Select(absl::StrCat(
                    ZeroIfEmpty(absl::StrCat("(SELECT ", column, " FROM ", simple_cte, ")")),
                    " AS ", column));
            }
        }
        rows.push_back(row.Build());
    }

    query.Select("*")
        .From(absl::StrCat("(\n", rows[0], "\nUNION ALL\n", rows[1], "\n)"))
        .OrderBy("period");
    return query.Build();
}

/// Per-period statement of a grouped request at granularity "full". Each CTE
/// yields one row per group; a period row exists for every group key found
/// by any of them, metrics missing for that key reading 0.
std::string BuildGroupedPerPeriod(const ShapeInput& in, ParamMap& params) {
    const Grouping& grouping = *in.grouping;
    MergeParams(params, grouping.params);

    std::vector<const MetricTranslation*> simple;
    for (const auto& metric : in.metrics) {
        MergeParams(params, metric.params);
        if (!metric.requires_subquery) {
            simple.push_back(&metric);
        }
    }

    SelectBuilder query;
    std::vector<std::string> rows;

    for (const Period& period : kPeriods) {
        std::vector<std::string> key_sources;

        const std::string simple_cte = absl::StrCat("simple_metrics_", period.name);
        if (!simple.empty()) {
            SelectBuilder cte;
            cte.Select(GroupKeyExpression(grouping));
            for (const auto* metric : simple) {
                cte.Select(metric->SelectWithAlias());
            }
            cte.From(PrimaryTableSource(period.start_param, period.end_param));
            AddChildJoins(cte, simple, period.start_param, period.end_param);
            cte.Where(WindowCondition(period.start_param, period.end_param))
                .Where(in.filter.where_clause)
                .Where(grouping.extra_condition)
                .GroupBy("group_key");
            if (grouping.mode == GroupKeyMode::kRaw) {
                cte.Having("group_key != ''");
            }
            query.With(simple_cte, cte.Build());
            key_sources.push_back(simple_cte);
        }

        SelectBuilder row;
        row.Select(absl::StrCat("'", period.name, "' AS period"))
            .Select("keys.group_key AS group_key");
        if (!simple.empty()) {
            row.Join(absl::StrCat("LEFT JOIN ", simple_cte, " ON ", simple_cte,
                                  ".group_key = keys.group_key"));
        }
        for (const auto& metric : in.metrics) {
            const std::string column = QuoteIdentifier(metric.alias);
            if (!metric.requires_subquery) {
                row.Select(absl::StrCat(ZeroIfEmpty(absl::StrCat(simple_cte, ".", column)),
                                        " AS ", column));
                continue;
            }
            const std::string cte_name =
                absl::StrCat("cte_", SanitizeIdentifier(metric.alias), "_", period.name);
            query.With(cte_name,
                       SubqueryChain(metric, in.filter, period.start_param, period.end_param,
                                     &grouping));
            key_sources.push_back(cte_name);
            row.Join(absl::StrCat("LEFT JOIN ", cte_name, " ON ", cte_name,
                                  ".group_key = keys.group_key"));
            row.Select(absl::StrCat(ZeroIfEmpty(absl::StrCat(cte_name, ".value")), " AS ", column));
        }

        std::vector<std::string> key_selects;
        for (const auto& source : key_sources) {
            key_selects.push_back(absl::StrCat("SELECT group_key FROM ", source));
        }
        row.From(absl::StrCat("(\n", absl::StrJoin(key_selects, "\nUNION DISTINCT\n"),
                              "\n) AS keys"));
        rows.push_back(row.Build());
    }

    query.Select("*")
        .From(absl::StrCat("(\n", rows[0], "\nUNION ALL\n", rows[1], "\n)"))
        .OrderBy("period")
        .OrderBy("group_key");
    return query.Build();
}

absl::Status ValidateRequest(const TimeseriesRequest& request) {
    if (request.tenant_id.empty()) {
        return InvalidArgumentError("tenantId must not be empty");
    }
    if (request.current_end <= request.current_start) {
        return InvalidArgumentError("currentEnd must be after currentStart");
    }
    if (request.previous_start > request.current_start) {
        return InvalidArgumentError("previousStart must not be after currentStart");
    }
    if (request.granularity_minutes.has_value() && *request.granularity_minutes <= 0) {
        return InvalidArgumentError("granularity must be a positive number of minutes or \"full\"");
    }
    std::set<int> indexes;
    for (const auto& series : request.series) {
        if (!indexes.insert(series.index).second) {
            return InvalidArgumentError(
                absl::StrCat("series index ", series.index, " is used more than once"));
        }
    }
    return absl::OkStatus();
}

}  // namespace

CompilerOptions CompilerOptions::FromConfig(const Config& config) {
    CompilerOptions options;
    options.default_time_zone =
        config.GetString("analytics.default_time_zone", options.default_time_zone);
    options.max_buckets = config.GetInt("analytics.max_buckets", options.max_buckets);
    options.max_filter_options =
        config.GetInt("analytics.max_filter_options", options.max_filter_options);
    options.top_documents_limit =
        config.GetInt("analytics.top_documents_limit", options.top_documents_limit);
    options.feedbacks_limit = config.GetInt("analytics.feedbacks_limit", options.feedbacks_limit);
    return options;
}

std::string_view QueryShapeName(QueryShape shape) {
    switch (shape) {
        case QueryShape::kBucketedSeries: return "bucketed-series";
        case QueryShape::kDedupGrouping: return "dedup-grouping";
        case QueryShape::kSummary: return "summary";
        case QueryShape::kSubquery: return "subquery";
    }
    return "bucketed-series";
}

bool GroupingNeedsDedup(std::string_view group_by) {
    ParamNames scratch;
    return ResolveGrouping(group_by, std::nullopt, scratch).needs_dedup;
}

bool GroupingJoinsChildTable(std::string_view group_by) {
    ParamNames scratch;
    return !ResolveGrouping(group_by, std::nullopt, scratch).joins.empty();
}

AggregationBuilder::AggregationBuilder(CompilerOptions options)
    : options_(std::move(options)) {
    options_.default_time_zone = ResolveTimeZone(options_.default_time_zone);
}

QueryShape AggregationBuilder::SelectQueryShape(const TimeseriesRequest& request) {
    bool any_subquery = false;
    for (const auto& series : request.series) {
        any_subquery = any_subquery || RequiresSubquery(series);
    }
    const bool full = !request.granularity_minutes.has_value();

    if (request.group_by.has_value() && !request.group_by->empty()) {
        if (full && any_subquery && !GroupingJoinsChildTable(*request.group_by)) {
            return QueryShape::kSubquery;
        }
        return GroupingNeedsDedup(*request.group_by) ? QueryShape::kDedupGrouping
                                                     : QueryShape::kBucketedSeries;
    }
    if (!full) {
        return QueryShape::kBucketedSeries;
    }
    return any_subquery ? QueryShape::kSubquery : QueryShape::kSummary;
}

absl::StatusOr<BuiltQuery> AggregationBuilder::BuildTimeseriesQuery(
    const TimeseriesRequest& request) const {
    TRACELENS_RETURN_IF_ERROR(ValidateRequest(request));

    ParamNames names;
    ShapeInput in;

    TRACELENS_ASSIGN_OR_RETURN(in.filter, TranslateAllFilters(request.filters, names));
    for (const auto& series : request.series) {
        TRACELENS_ASSIGN_OR_RETURN(MetricTranslation metric, TranslateSeries(series, names));
        in.metrics.push_back(std::move(metric));
    }

    if (request.group_by.has_value() && !request.group_by->empty()) {
        in.grouping = ResolveGrouping(*request.group_by, request.group_by_key, names);
    }

    if (request.granularity_minutes.has_value()) {
        const std::string time_zone = request.time_zone.has_value()
                                          ? ResolveTimeZone(*request.time_zone,
                                                            options_.default_time_zone)
                                          : options_.default_time_zone;
        const int64_t granularity = CapGranularity(*request.granularity_minutes,
                                                   request.current_start, request.current_end,
                                                   options_.max_buckets);
        in.date_expression = DateTruncExpression(granularity, time_zone, Ts("CreatedAt"));
    }

    BuiltQuery result;
    result.params = {
        {"tenantId", request.tenant_id},
        {"currentStart", request.current_start},
        {"currentEnd", request.current_end},
        {"previousStart", request.previous_start},
        {"previousEnd", request.current_start},
    };
    MergeParams(result.params, in.filter.params);

    const QueryShape shape = SelectQueryShape(request);
    TRACELENS_LOG_DEBUG("Compiling {} series for tenant {} as {}", request.series.size(),
                        request.tenant_id, QueryShapeName(shape));

    switch (shape) {
        case QueryShape::kBucketedSeries:
            result.sql = BuildBucketed(in, result.params);
            break;
        case QueryShape::kDedupGrouping:
            result.sql = BuildDedupGrouping(in, result.params);
            break;
        case QueryShape::kSummary:
        case QueryShape::kSubquery:
            result.sql = in.grouping.has_value() ? BuildGroupedPerPeriod(in, result.params)
                                                 : BuildPerPeriod(in, result.params);
            break;
    }

    TRACELENS_LOG_TRACE("Generated SQL: {}", result.sql);
    return result;
}

}  // namespace tracelens::analytics
