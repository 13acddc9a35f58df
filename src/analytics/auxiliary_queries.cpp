/// @file auxiliary_queries.cpp
/// @brief Filter-options, top-documents and feedbacks statements

#include <optional>
#include <set>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>

#include "analytics/aggregation_builder.h"
#include "analytics/field_map.h"
#include "analytics/filter_translator.h"
#include "analytics/sql_builder.h"
#include "common/error.h"
#include "common/logging.h"

namespace tracelens::analytics {

namespace {

constexpr std::string_view kEncodedDot = "\xC2\xB7";

/// Column template of one filter-options field.
struct OptionSource {
    std::string field;
    std::string label;
    std::set<TableId> joins;
    std::vector<std::string> conditions;
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

OptionSource NonEmptyColumn(std::string expression, std::set<TableId> joins = {}) {
    OptionSource source;
    source.field = expression;
    source.label = expression;
    source.joins = std::move(joins);
    source.conditions.push_back(absl::StrCat(expression, " != ''"));
    return source;
}

/// Values produced by arrayJoin are referenced through the field alias so
/// the array is unnested only once.
OptionSource Unnested(std::string array_expression, std::set<TableId> joins = {}) {
    OptionSource source;
    source.field = absl::StrCat("arrayJoin(", array_expression, ")");
    source.label = "field";
    source.joins = std::move(joins);
    source.conditions.push_back("field != ''");
    return source;
}

std::string JsonArray(std::string_view attribute) {
    return absl::StrCat("JSONExtract(", Ts(absl::StrCat("Attributes['", attribute, "']")),
                        ", 'Array(String)')");
}

std::optional<std::string> NonEmpty(const std::optional<std::string>& value) {
    if (value.has_value() && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

void ScopeToEvaluator(OptionSource& source, const std::optional<std::string>& evaluator_id,
                      ParamNames& names) {
    if (!evaluator_id.has_value()) {
        return;
    }
    const std::string param = names.Next("evaluatorId");
    source.params[param] = *evaluator_id;
    source.conditions.push_back(
        absl::StrCat(Es("EvaluatorId"), " = ", Placeholder(param, "String")));
}

std::optional<OptionSource> ResolveOptionSource(const FilterOptionsRequest& request,
                                                ParamNames& names) {
    const auto field = ParseFilterField(request.field);
    if (!field.has_value()) {
        return std::nullopt;
    }
    const std::optional<std::string> key = NonEmpty(request.key);

    switch (*field) {
        case FilterField::kTopics:
            return NonEmptyColumn(Ts("TopicId"));
        case FilterField::kSubtopics:
            return NonEmptyColumn(Ts("SubTopicId"));
        case FilterField::kUserId:
            return NonEmptyColumn(Ts("Attributes['langwatch.user_id']"));
        case FilterField::kThreadId:
            return NonEmptyColumn(Ts("Attributes['gen_ai.conversation.id']"));
        case FilterField::kCustomerId:
            return NonEmptyColumn(Ts("Attributes['langwatch.customer_id']"));
        case FilterField::kLabels:
            return Unnested(JsonArray("langwatch.labels"));
        case FilterField::kPromptIds:
            return Unnested(JsonArray("langwatch.prompt_ids"));
        case FilterField::kMetadataKey: {
            // Dots are encoded so keys can be used as nested filter keys.
            OptionSource source;
            source.field = absl::StrCat("replaceAll(label, '.', ", QuoteLiteral(kEncodedDot), ")");
            source.label = absl::StrCat("arrayJoin(mapKeys(", Ts("Attributes"), "))");
            return source;
        }
        case FilterField::kMetadataValue: {
            if (!key.has_value()) {
                return std::nullopt;
            }
            const std::string param = names.Next("metaKey");
            OptionSource source = NonEmptyColumn(
                absl::StrCat(Ts("Attributes"), "[", Placeholder(param, "String"), "]"));
            source.params[param] = absl::StrReplaceAll(*key, {{kEncodedDot, "."}});
            return source;
        }
        case FilterField::kSpanModel:
            return NonEmptyColumn(Ss("SpanAttributes['gen_ai.request.model']"),
                                  {TableId::kSpanChild});
        case FilterField::kSpanType:
            return NonEmptyColumn(Ss("SpanAttributes['langwatch.span.type']"),
                                  {TableId::kSpanChild});
        case FilterField::kEventType:
            return Unnested(Ss("\"Events.Name\""), {TableId::kSpanChild});
        case FilterField::kEvaluatorId:
        case FilterField::kEvaluatorIdGuardrailsOnly: {
            OptionSource source = NonEmptyColumn(Es("EvaluatorId"), {TableId::kEvalChild});
            source.label = absl::StrCat("concat('[', if(", Es("EvaluatorType"), " = '', 'custom', ",
                                        Es("EvaluatorType"), "), '] ', ", Es("EvaluatorName"), ")");
            if (*field == FilterField::kEvaluatorIdGuardrailsOnly) {
                source.conditions.push_back(absl::StrCat(Es("IsGuardrail"), " = 1"));
            }
            return source;
        }
        case FilterField::kEvaluationLabel: {
            if (!key.has_value()) {
                return std::nullopt;
            }
            OptionSource source = NonEmptyColumn(Es("Label"), {TableId::kEvalChild});
            ScopeToEvaluator(source, key, names);
            return source;
        }
        case FilterField::kEvaluationState: {
            OptionSource source = NonEmptyColumn(Es("Status"), {TableId::kEvalChild});
            ScopeToEvaluator(source, key, names);
            return source;
        }
        case FilterField::kTraceError: {
            OptionSource source;
            source.field = absl::StrCat("if(", Ts("ContainsErrorStatus"), " = 1, 'true', 'false')");
            source.label = absl::StrCat("if(", Ts("ContainsErrorStatus"),
                                        " = 1, 'Traces with error', 'Traces without error')");
            return source;
        }
        case FilterField::kHasAnnotation: {
            OptionSource source;
            source.field = absl::StrCat("if(", Ts("HasAnnotation"), " = 1, 'true', 'false')");
            source.label = absl::StrCat("if(", Ts("HasAnnotation"),
                                        " = 1, 'Annotated', 'Not annotated')");
            return source;
        }
        default:
            return std::nullopt;
    }
}

/// %term% with LIKE wildcards in the term escaped.
std::string ContainsPattern(std::string_view term) {
    return absl::StrCat("%", absl::StrReplaceAll(term, {{"\\", "\\\\"}, {"%", "\\%"}, {"_", "\\_"}}),
                        "%");
}

absl::Status ValidateWindow(std::string_view tenant_id, Timestamp start, Timestamp end) {
    if (tenant_id.empty()) {
        return InvalidArgumentError("tenantId must not be empty");
    }
    if (end <= start) {
        return InvalidArgumentError("endDate must be after startDate");
    }
    return absl::OkStatus();
}

ParamMap WindowParams(std::string_view tenant_id, Timestamp start, Timestamp end) {
    return {
        {"tenantId", std::string(tenant_id)},
        {"startDate", start},
        {"endDate", end},
    };
}

/// trace_summaries joined to the span events, restricted to the window and filters.
void SpanEventsSource(SelectBuilder& query, const FilterTranslation& filter) {
    query.From(PrimaryTableSource("startDate", "endDate"))
        .Join(JoinClause(TableId::kSpanChild))
        .Where(filter.where_clause);
}

}  // namespace

absl::StatusOr<BuiltQuery> AggregationBuilder::BuildFilterOptionsQuery(
    const FilterOptionsRequest& request) const {
    TRACELENS_RETURN_IF_ERROR(ValidateWindow(request.tenant_id, request.start, request.end));

    ParamNames names;
    BuiltQuery result;
    result.params = WindowParams(request.tenant_id, request.start, request.end);

    std::optional<OptionSource> source = ResolveOptionSource(request, names);
    if (!source.has_value()) {
        TRACELENS_LOG_DEBUG("No filter options available for field '{}'", request.field);
        result.sql = "SELECT '' AS field, '' AS label, 0 AS count WHERE 1=0";
        return result;
    }

    TRACELENS_ASSIGN_OR_RETURN(FilterTranslation filter,
                               TranslateAllFilters(request.filters, names));

    const bool joins_child = !source->joins.empty();
    SelectBuilder query;
    query.Select(absl::StrCat(source->field, " AS field"))
        .Select(absl::StrCat(source->label, " AS label"))
        .Select(joins_child ? absl::StrCat("uniqExact(", Ts("TraceId"), ") AS count")
                            : std::string("count() AS count"))
        .From(PrimaryTableSource("startDate", "endDate"));
    for (TableId table : source->joins) {
        query.Join(JoinClause(table));
    }
    for (const auto& condition : source->conditions) {
        query.Where(condition);
    }
    query.Where(filter.where_clause);

    if (request.search.has_value() && !request.search->empty()) {
        query.Where(absl::StrCat("label ILIKE ", Placeholder("searchQuery", "String")));
        result.params["searchQuery"] = ContainsPattern(*request.search);
    }

    query.GroupBy("field").GroupBy("label").OrderBy("count DESC").Limit(options_.max_filter_options);

    for (const auto& [name, value] : source->params) {
        result.params[name] = value;
    }
    for (const auto& [name, value] : filter.params) {
        result.params[name] = value;
    }
    result.sql = query.Build();
    return result;
}

absl::StatusOr<TopDocumentsQuery> AggregationBuilder::BuildTopDocumentsQuery(
    const DocumentsRequest& request) const {
    TRACELENS_RETURN_IF_ERROR(ValidateWindow(request.tenant_id, request.start, request.end));

    ParamNames names;
    TRACELENS_ASSIGN_OR_RETURN(FilterTranslation filter,
                               TranslateAllFilters(request.filters, names));

    const std::string contexts = Ss("SpanAttributes['langwatch.rag.contexts']");
    const std::string document_id = "JSONExtractString(context, 'document_id')";

    SelectBuilder refs;
    refs.Select(absl::StrCat(Ts("TraceId"), " AS trace_id"))
        .Select(absl::StrCat(document_id, " AS document_id"))
        .Select("JSONExtractString(context, 'content') AS content");
    SpanEventsSource(refs, filter);
    refs.ArrayJoin(absl::StrCat("JSONExtractArrayRaw(", contexts, ") AS context"))
        .Where(absl::StrCat(contexts, " != ''"));

    SelectBuilder documents;
    documents.With("document_refs", refs.Build())
        .Select("document_id AS documentId")
        .Select("count() AS count")
        .Select("any(trace_id) AS traceId")
        .Select("any(content) AS content")
        .From("document_refs")
        .Where("document_id != ''")
        .GroupBy("document_id")
        .OrderBy("count DESC")
        .Limit(options_.top_documents_limit);

    SelectBuilder total;
    total.Select(absl::StrCat("uniqExact(", document_id, ") AS total"));
    SpanEventsSource(total, filter);
    total.ArrayJoin(absl::StrCat("JSONExtractArrayRaw(", contexts, ") AS context"))
        .Where(absl::StrCat(contexts, " != ''"))
        .Where(absl::StrCat(document_id, " != ''"));

    TopDocumentsQuery result;
    result.documents_sql = documents.Build();
    result.total_sql = total.Build();
    result.params = WindowParams(request.tenant_id, request.start, request.end);
    for (const auto& [name, value] : filter.params) {
        result.params[name] = value;
    }
    return result;
}

absl::StatusOr<BuiltQuery> AggregationBuilder::BuildFeedbacksQuery(
    const DocumentsRequest& request) const {
    TRACELENS_RETURN_IF_ERROR(ValidateWindow(request.tenant_id, request.start, request.end));

    ParamNames names;
    TRACELENS_ASSIGN_OR_RETURN(FilterTranslation filter,
                               TranslateAllFilters(request.filters, names));

    SelectBuilder query;
    query.Select(absl::StrCat(Ts("TraceId"), " AS trace_id"))
        .Select(absl::StrCat(Ss("SpanId"), " AS span_id"))
        .Select("toUnixTimestamp64Milli(event_timestamp) AS started_at")
        .Select("event_name AS event_type")
        .Select("event_attrs AS attributes");
    SpanEventsSource(query, filter);
    query.ArrayJoin(absl::StrCat(Ss("\"Events.Timestamp\""), " AS event_timestamp"))
        .ArrayJoin(absl::StrCat(Ss("\"Events.Name\""), " AS event_name"))
        .ArrayJoin(absl::StrCat(Ss("\"Events.Attributes\""), " AS event_attrs"))
        .Where("event_name = 'thumbs_up_down'")
        .Where("mapContains(event_attrs, 'event.metrics.vote')")
        .OrderBy("event_timestamp DESC")
        .Limit(options_.feedbacks_limit);

    BuiltQuery result;
    result.sql = query.Build();
    result.params = WindowParams(request.tenant_id, request.start, request.end);
    for (const auto& [name, value] : filter.params) {
        result.params[name] = value;
    }
    return result;
}

}  // namespace tracelens::analytics
