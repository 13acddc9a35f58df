#include "analytics/field_map.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "analytics/sql_builder.h"

namespace tracelens::analytics {

namespace {

FieldMapping Primary(std::string path, std::string column,
                     MapValueKind kind = MapValueKind::kNone, bool array = false) {
    return FieldMapping{std::move(path), TableId::kPrimary, std::move(column), array, kind, false};
}

FieldMapping Child(TableId table, std::string path, std::string column, bool array = false) {
    return FieldMapping{std::move(path), table, std::move(column), array, MapValueKind::kNone, false};
}

FieldMapping Numeric(FieldMapping mapping) {
    mapping.is_numeric = true;
    return mapping;
}

std::vector<FieldMapping> BuildRegistry() {
    return {
        // Trace-level facts
        Primary("metadata.trace_id", "TraceId"),
        Primary("metadata.user_id", "Attributes['langwatch.user_id']", MapValueKind::kString),
        Primary("metadata.thread_id", "Attributes['gen_ai.conversation.id']", MapValueKind::kString),
        Primary("metadata.customer_id", "Attributes['langwatch.customer_id']", MapValueKind::kString),
        Primary("metadata.labels", "Attributes['langwatch.labels']", MapValueKind::kJsonArray, true),
        Primary("metadata.prompt_ids", "Attributes['langwatch.prompt_ids']", MapValueKind::kJsonArray, true),
        Primary("metadata.model", "Models", MapValueKind::kNone, true),
        Primary("topics.topics", "TopicId"),
        Primary("topics.subtopics", "SubTopicId"),
        Numeric(Primary("performance.completion_time", "TotalDurationMs")),
        Numeric(Primary("performance.first_token", "TimeToFirstTokenMs")),
        Numeric(Primary("performance.total_cost", "TotalCost")),
        Numeric(Primary("performance.prompt_tokens", "TotalPromptTokenCount")),
        Numeric(Primary("performance.completion_tokens", "TotalCompletionTokenCount")),
        Numeric(Primary("performance.tokens_per_second", "TokensPerSecond")),
        Numeric(Primary("traces.error", "ContainsErrorStatus")),
        Numeric(Primary("annotations.hasAnnotation", "HasAnnotation")),
        Numeric(Primary("sentiment.input_sentiment",
                        "Attributes['langwatch.input.satisfaction_score']", MapValueKind::kNumber)),

        // Spans and their events
        Child(TableId::kSpanChild, "spans.model", "SpanAttributes['gen_ai.request.model']"),
        Child(TableId::kSpanChild, "spans.type", "SpanAttributes['langwatch.span.type']"),
        Child(TableId::kSpanChild, "spans.span_id", "SpanId"),
        Child(TableId::kSpanChild, "events.event_type", "\"Events.Name\"", true),
        Child(TableId::kSpanChild, "events.attributes", "\"Events.Attributes\"", true),

        // Evaluation runs
        Child(TableId::kEvalChild, "evaluations.evaluator_id", "EvaluatorId"),
        Child(TableId::kEvalChild, "evaluations.evaluation_id", "EvaluationId"),
        Numeric(Child(TableId::kEvalChild, "evaluations.score", "Score")),
        Numeric(Child(TableId::kEvalChild, "evaluations.passed", "Passed")),
        Child(TableId::kEvalChild, "evaluations.label", "Label"),
        Child(TableId::kEvalChild, "evaluations.state", "Status"),
        Child(TableId::kEvalChild, "evaluations.evaluator_name", "EvaluatorName"),
        Child(TableId::kEvalChild, "evaluations.evaluator_type", "EvaluatorType"),
        Numeric(Child(TableId::kEvalChild, "evaluations.is_guardrail", "IsGuardrail")),
    };
}

/// metadata.someField -> metadata_some_field
std::string SnakeCase(std::string_view path) {
    std::string out;
    out.reserve(path.size() + 4);
    for (size_t i = 0; i < path.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(path[i]);
        if (absl::ascii_isupper(c)) {
            if (i > 0 && absl::ascii_isalnum(static_cast<unsigned char>(path[i - 1])) &&
                !absl::ascii_isupper(static_cast<unsigned char>(path[i - 1]))) {
                out.push_back('_');
            }
            out.push_back(absl::ascii_tolower(c));
        } else if (absl::ascii_islower(c) || absl::ascii_isdigit(c) || c == '_') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
    }
    if (out.empty()) {
        out = "unknown_field";
    }
    return out;
}

}  // namespace

const std::vector<FieldMapping>& FieldMappings() {
    static const std::vector<FieldMapping> registry = BuildRegistry();
    return registry;
}

const FieldMapping* FindFieldMapping(std::string_view path) {
    for (const auto& mapping : FieldMappings()) {
        if (mapping.logical_path == path) {
            return &mapping;
        }
    }
    return nullptr;
}

FieldMapping ResolveField(std::string_view path) {
    if (const FieldMapping* mapping = FindFieldMapping(path)) {
        return *mapping;
    }
    FieldMapping fallback;
    fallback.logical_path = std::string(path);
    fallback.table = TableId::kPrimary;
    fallback.column_expr = SnakeCase(path);
    fallback.is_fallback = true;
    return fallback;
}

std::string_view TableName(TableId table) {
    switch (table) {
        case TableId::kPrimary: return "trace_summaries";
        case TableId::kSpanChild: return "stored_spans";
        case TableId::kEvalChild: return "evaluation_runs";
    }
    return "trace_summaries";
}

std::string_view TableAlias(TableId table) {
    switch (table) {
        case TableId::kPrimary: return "ts";
        case TableId::kSpanChild: return "ss";
        case TableId::kEvalChild: return "es";
    }
    return "ts";
}

std::string JoinPredicate(TableId table) {
    const std::string_view child = TableAlias(table);
    const std::string_view ts = TableAlias(TableId::kPrimary);
    return absl::StrCat(child, ".TenantId = ", ts, ".TenantId AND ",
                        child, ".TraceId = ", ts, ".TraceId");
}

std::string JoinClause(TableId table) {
    if (table == TableId::kPrimary) {
        return "";
    }
    return absl::StrCat("LEFT JOIN ", TableName(table), " ", TableAlias(table),
                        " ON ", JoinPredicate(table));
}

std::string Qualify(TableId table, std::string_view column_expr) {
    return absl::StrCat(TableAlias(table), ".", column_expr);
}

std::string QualifiedColumn(std::string_view path) {
    const FieldMapping mapping = ResolveField(path);
    return Qualify(mapping.table, mapping.column_expr);
}

std::string PrimaryTableSource(std::string_view start_param, std::string_view end_param) {
    SelectBuilder latest;
    latest.Select("*")
        .From(std::string(TableName(TableId::kPrimary)))
        .Where(absl::StrCat("TenantId = ", Placeholder("tenantId", "String")))
        .Where(absl::StrCat("CreatedAt >= ", Placeholder(start_param, "DateTime64(3)")))
        .Where(absl::StrCat("CreatedAt < ", Placeholder(end_param, "DateTime64(3)")))
        .OrderBy("TenantId")
        .OrderBy("TraceId")
        .OrderBy("UpdatedAt DESC")
        .LimitBy(1, "TenantId, TraceId");
    return absl::StrCat("(\n", latest.Build(), "\n) AS ", TableAlias(TableId::kPrimary));
}

}  // namespace tracelens::analytics
