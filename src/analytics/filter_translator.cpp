#include "analytics/filter_translator.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>

#include "analytics/field_map.h"
#include "common/error.h"

namespace tracelens::analytics {

namespace {

constexpr std::pair<FilterField, std::string_view> kFieldNames[] = {
    {FilterField::kTopics, "topics.topics"},
    {FilterField::kSubtopics, "topics.subtopics"},
    {FilterField::kUserId, "metadata.user_id"},
    {FilterField::kThreadId, "metadata.thread_id"},
    {FilterField::kCustomerId, "metadata.customer_id"},
    {FilterField::kLabels, "metadata.labels"},
    {FilterField::kMetadataKey, "metadata.key"},
    {FilterField::kMetadataValue, "metadata.value"},
    {FilterField::kPromptIds, "metadata.prompt_ids"},
    {FilterField::kTraceError, "traces.error"},
    {FilterField::kSpanType, "spans.type"},
    {FilterField::kSpanModel, "spans.model"},
    {FilterField::kEvaluatorId, "evaluations.evaluator_id"},
    {FilterField::kEvaluatorIdGuardrailsOnly, "evaluations.evaluator_id.guardrails_only"},
    {FilterField::kEvaluationPassed, "evaluations.passed"},
    {FilterField::kEvaluationScore, "evaluations.score"},
    {FilterField::kEvaluationLabel, "evaluations.label"},
    {FilterField::kEvaluationState, "evaluations.state"},
    {FilterField::kEventType, "events.event_type"},
    {FilterField::kEventMetricKey, "events.metrics.key"},
    {FilterField::kEventMetricValue, "events.metrics.value"},
    {FilterField::kEventDetailKey, "events.event_details.key"},
    {FilterField::kHasAnnotation, "annotations.hasAnnotation"},
};

/// Middle dot used by clients to encode '.' inside metadata keys.
constexpr std::string_view kEncodedDot = "\xC2\xB7";

FilterTranslation Trivial() {
    return FilterTranslation{};
}

FilterTranslation OnPrimary(std::string clause, ParamMap params = {}) {
    FilterTranslation t;
    t.where_clause = std::move(clause);
    t.params = std::move(params);
    return t;
}

/// EXISTS over a child table correlated on tenant and trace. Never a JOIN,
/// so matching several child rows cannot multiply the trace row.
FilterTranslation ExistsIn(TableId child, std::string_view condition, ParamMap params) {
    FilterTranslation t;
    t.where_clause = absl::StrCat(
        "EXISTS (SELECT 1 FROM ", TableName(child), " ", TableAlias(child),
        " WHERE ", JoinPredicate(child), " AND ", condition, ")");
    t.params = std::move(params);
    t.uses_exists_subquery = true;
    return t;
}

std::string Ts(std::string_view column) {
    return Qualify(TableId::kPrimary, column);
}

std::string Ss(std::string_view column) {
    return Qualify(TableId::kSpanChild, column);
}

std::string Es(std::string_view column) {
    return Qualify(TableId::kEvalChild, column);
}

FilterTranslation InList(std::string_view column, std::string_view prefix,
                         const std::vector<std::string>& values, ParamNames& names) {
    const std::string param = names.Next(prefix);
    return OnPrimary(
        absl::StrCat(Ts(column), " IN (", Placeholder(param, "Array(String)"), ")"),
        {{param, values}});
}

FilterTranslation AttributeIn(std::string_view attribute_key, std::string_view prefix,
                              const std::vector<std::string>& values, ParamNames& names) {
    const std::string param = names.Next(prefix);
    const std::string key_param = absl::StrCat(param, "_key");
    return OnPrimary(
        absl::StrCat(Ts("Attributes"), "[", Placeholder(key_param, "String"), "] IN (",
                     Placeholder(param, "Array(String)"), ")"),
        {{key_param, std::string(attribute_key)}, {param, values}});
}

FilterTranslation JsonArrayHasAny(std::string_view attribute_key, std::string_view prefix,
                                  const std::vector<std::string>& values, ParamNames& names) {
    const std::string param = names.Next(prefix);
    return OnPrimary(
        absl::StrCat("hasAny(JSONExtract(", Ts("Attributes"), "['", attribute_key,
                     "'], 'Array(String)'), ", Placeholder(param, "Array(String)"), ")"),
        {{param, values}});
}

/// Presence filter on a 0/1 primary column. Requesting both states is a no-op.
FilterTranslation BooleanFlag(std::string_view column, const std::vector<std::string>& values) {
    const bool has_true = std::find(values.begin(), values.end(), "true") != values.end();
    const bool has_false = std::find(values.begin(), values.end(), "false") != values.end();

    if (has_true && !has_false) {
        return OnPrimary(absl::StrCat(Ts(column), " = 1"));
    }
    if (has_false && !has_true) {
        return OnPrimary(absl::StrCat("(", Ts(column), " = 0 OR ", Ts(column), " IS NULL)"));
    }
    return Trivial();
}

absl::StatusOr<std::pair<double, double>> ParseRange(std::string_view field,
                                                     const std::vector<std::string>& values) {
    if (values.size() != 2) {
        return InvalidArgumentError(absl::StrCat(
            "Range filter '", field, "' expects exactly two values, got ", values.size()));
    }
    double bounds[2] = {0.0, 0.0};
    for (size_t i = 0; i < 2; ++i) {
        if (!absl::SimpleAtod(values[i], &bounds[i]) || !std::isfinite(bounds[i])) {
            return InvalidArgumentError(absl::StrCat(
                "Range filter '", field, "' has a non-numeric bound"));
        }
    }
    if (bounds[0] > bounds[1]) {
        std::swap(bounds[0], bounds[1]);
    }
    return std::make_pair(bounds[0], bounds[1]);
}

/// Optional "AND es.EvaluatorId = {p:String}" scoping for evaluation filters.
std::string EvaluatorScope(const std::optional<std::string>& evaluator_id,
                           ParamMap& params, ParamNames& names) {
    if (!evaluator_id.has_value() || evaluator_id->empty()) {
        return "";
    }
    const std::string param = names.Next("evaluatorId");
    params[param] = *evaluator_id;
    return absl::StrCat(Es("EvaluatorId"), " = ", Placeholder(param, "String"), " AND ");
}

FilterTranslation EvaluatorIds(const std::vector<std::string>& values, bool guardrails_only,
                               ParamNames& names) {
    const std::string param = names.Next("evaluatorIds");
    std::string condition = absl::StrCat(
        Es("EvaluatorId"), " IN (", Placeholder(param, "Array(String)"), ")");
    if (guardrails_only) {
        absl::StrAppend(&condition, " AND ", Es("IsGuardrail"), " = 1");
    }
    return ExistsIn(TableId::kEvalChild, condition, {{param, values}});
}

FilterTranslation EvaluationPassed(const std::vector<std::string>& values,
                                   const std::optional<std::string>& evaluator_id,
                                   ParamNames& names) {
    // Values other than true/false/1/0 are ignored.
    std::vector<int64_t> passed;
    for (const auto& value : values) {
        int64_t flag;
        if (value == "true" || value == "1") {
            flag = 1;
        } else if (value == "false" || value == "0") {
            flag = 0;
        } else {
            continue;
        }
        if (std::find(passed.begin(), passed.end(), flag) == passed.end()) {
            passed.push_back(flag);
        }
    }
    if (passed.size() != 1) {
        return Trivial();
    }

    ParamMap params;
    const std::string scope = EvaluatorScope(evaluator_id, params, names);
    const std::string param = names.Next("evalPassed");
    params[param] = passed;
    return ExistsIn(TableId::kEvalChild,
                    absl::StrCat(scope, Es("Passed"), " IN (",
                                 Placeholder(param, "Array(UInt8)"), ")"),
                    std::move(params));
}

absl::StatusOr<FilterTranslation> EvaluationScore(const std::vector<std::string>& values,
                                                  const std::optional<std::string>& evaluator_id,
                                                  ParamNames& names) {
    TRACELENS_ASSIGN_OR_RETURN(auto range, ParseRange("evaluations.score", values));

    ParamMap params;
    const std::string scope = EvaluatorScope(evaluator_id, params, names);
    const std::string min_param = names.Next("scoreMin");
    const std::string max_param = names.Next("scoreMax");
    params[min_param] = range.first;
    params[max_param] = range.second;
    return ExistsIn(TableId::kEvalChild,
                    absl::StrCat(scope, Es("Score"), " >= ", Placeholder(min_param, "Float64"),
                                 " AND ", Es("Score"), " <= ", Placeholder(max_param, "Float64")),
                    std::move(params));
}

FilterTranslation EvaluationColumnIn(std::string_view column, std::string_view prefix,
                                     const std::vector<std::string>& values,
                                     const std::optional<std::string>& evaluator_id,
                                     ParamNames& names) {
    ParamMap params;
    const std::string scope = EvaluatorScope(evaluator_id, params, names);
    const std::string param = names.Next(prefix);
    params[param] = values;
    return ExistsIn(TableId::kEvalChild,
                    absl::StrCat(scope, Es(column), " IN (",
                                 Placeholder(param, "Array(String)"), ")"),
                    std::move(params));
}

FilterTranslation SpanAttributeIn(std::string_view column, std::string_view prefix,
                                  const std::vector<std::string>& values, ParamNames& names) {
    const std::string param = names.Next(prefix);
    return ExistsIn(TableId::kSpanChild,
                    absl::StrCat(Ss(column), " IN (", Placeholder(param, "Array(String)"), ")"),
                    {{param, values}});
}

/// Events.Name and Events.Attributes are parallel arrays; when an event type
/// is given both are walked together so name and attributes match the same event.
FilterTranslation EventAttributeKeys(std::string_view attribute_prefix,
                                     const std::vector<std::string>& values,
                                     const std::optional<std::string>& event_type,
                                     ParamNames& names) {
    const std::string keys_param = names.Next("attributeKeys");
    ParamMap params{{keys_param, values}};

    const std::string has_key = absl::StrCat(
        "arrayExists(k -> mapContains(attrs, concat('", attribute_prefix, "', k)), ",
        Placeholder(keys_param, "Array(String)"), ")");

    std::string condition;
    if (event_type.has_value() && !event_type->empty()) {
        const std::string type_param = names.Next("eventType");
        params[type_param] = *event_type;
        condition = absl::StrCat(
            "arrayExists((name, attrs) -> name = ", Placeholder(type_param, "String"),
            " AND ", has_key, ", ", Ss("\"Events.Name\""), ", ", Ss("\"Events.Attributes\""), ")");
    } else {
        condition = absl::StrCat("arrayExists(attrs -> ", has_key, ", ",
                                 Ss("\"Events.Attributes\""), ")");
    }
    return ExistsIn(TableId::kSpanChild, condition, std::move(params));
}

absl::StatusOr<FilterTranslation> EventMetricValue(const std::vector<std::string>& values,
                                                   const std::optional<std::string>& event_type,
                                                   const std::optional<std::string>& metric_key,
                                                   ParamNames& names) {
    if (!metric_key.has_value() || metric_key->empty()) {
        return Trivial();
    }
    TRACELENS_ASSIGN_OR_RETURN(auto range, ParseRange("events.metrics.value", values));

    const std::string key_param = names.Next("metricKey");
    const std::string min_param = names.Next("metricMin");
    const std::string max_param = names.Next("metricMax");
    ParamMap params{
        {key_param, absl::StrCat(kEventMetricPrefix, *metric_key)},
        {min_param, range.first},
        {max_param, range.second},
    };

    const std::string value = absl::StrCat(
        "toFloat64OrNull(attrs[", Placeholder(key_param, "String"), "])");
    const std::string in_range = absl::StrCat(
        value, " >= ", Placeholder(min_param, "Float64"), " AND ",
        value, " <= ", Placeholder(max_param, "Float64"));

    std::string condition;
    if (event_type.has_value() && !event_type->empty()) {
        const std::string type_param = names.Next("eventType");
        params[type_param] = *event_type;
        condition = absl::StrCat(
            "arrayExists((name, attrs) -> name = ", Placeholder(type_param, "String"),
            " AND ", in_range, ", ", Ss("\"Events.Name\""), ", ", Ss("\"Events.Attributes\""), ")");
    } else {
        condition = absl::StrCat("arrayExists(attrs -> ", in_range, ", ",
                                 Ss("\"Events.Attributes\""), ")");
    }
    return ExistsIn(TableId::kSpanChild, condition, std::move(params));
}

absl::StatusOr<FilterTranslation> Dispatch(FilterField field,
                                           const std::vector<std::string>& values,
                                           const std::optional<std::string>& key,
                                           const std::optional<std::string>& subkey,
                                           ParamNames& names) {
    switch (field) {
        case FilterField::kTopics:
            return InList("TopicId", "topicIds", values, names);
        case FilterField::kSubtopics:
            return InList("SubTopicId", "subtopicIds", values, names);
        case FilterField::kUserId:
            return AttributeIn("langwatch.user_id", "metaValues", values, names);
        case FilterField::kThreadId:
            return AttributeIn("gen_ai.conversation.id", "metaValues", values, names);
        case FilterField::kCustomerId:
            return AttributeIn("langwatch.customer_id", "metaValues", values, names);
        case FilterField::kLabels:
            return JsonArrayHasAny("langwatch.labels", "labels", values, names);
        case FilterField::kPromptIds:
            return JsonArrayHasAny("langwatch.prompt_ids", "promptIds", values, names);
        case FilterField::kMetadataKey: {
            const std::string param = names.Next("metaKeys");
            return OnPrimary(
                absl::StrCat("arrayExists(k -> mapContains(", Ts("Attributes"), ", k), ",
                             Placeholder(param, "Array(String)"), ")"),
                {{param, values}});
        }
        case FilterField::kMetadataValue:
            if (!key.has_value() || key->empty()) {
                return Trivial();
            }
            return AttributeIn(absl::StrReplaceAll(*key, {{kEncodedDot, "."}}),
                               "metaValue", values, names);
        case FilterField::kTraceError:
            return BooleanFlag("ContainsErrorStatus", values);
        case FilterField::kHasAnnotation:
            return BooleanFlag("HasAnnotation", values);
        case FilterField::kSpanType:
            return SpanAttributeIn("SpanAttributes['langwatch.span.type']", "spanTypes",
                                   values, names);
        case FilterField::kSpanModel:
            return SpanAttributeIn("SpanAttributes['gen_ai.request.model']", "models",
                                   values, names);
        case FilterField::kEvaluatorId:
            return EvaluatorIds(values, false, names);
        case FilterField::kEvaluatorIdGuardrailsOnly:
            return EvaluatorIds(values, true, names);
        case FilterField::kEvaluationPassed:
            return EvaluationPassed(values, key, names);
        case FilterField::kEvaluationScore:
            return EvaluationScore(values, key, names);
        case FilterField::kEvaluationLabel:
            return EvaluationColumnIn("Label", "evalLabels", values, key, names);
        case FilterField::kEvaluationState:
            return EvaluationColumnIn("Status", "evalStates", values, key, names);
        case FilterField::kEventType: {
            const std::string param = names.Next("eventTypes");
            return ExistsIn(TableId::kSpanChild,
                            absl::StrCat("hasAny(", Ss("\"Events.Name\""), ", ",
                                         Placeholder(param, "Array(String)"), ")"),
                            {{param, values}});
        }
        case FilterField::kEventMetricKey:
            return EventAttributeKeys(kEventMetricPrefix, values, key, names);
        case FilterField::kEventDetailKey:
            return EventAttributeKeys(kEventDetailPrefix, values, key, names);
        case FilterField::kEventMetricValue:
            return EventMetricValue(values, key, subkey, names);
    }
    return Trivial();
}

}  // namespace

std::optional<FilterField> ParseFilterField(std::string_view name) {
    for (const auto& [field, field_name] : kFieldNames) {
        if (field_name == name) {
            return field;
        }
    }
    return std::nullopt;
}

std::string_view FilterFieldName(FilterField field) {
    for (const auto& [candidate, field_name] : kFieldNames) {
        if (candidate == field) {
            return field_name;
        }
    }
    return "";
}

absl::StatusOr<FilterTranslation> TranslateFilter(
    std::string_view field,
    const std::vector<std::string>& values,
    const std::optional<std::string>& key,
    const std::optional<std::string>& subkey,
    ParamNames& names
) {
    if (values.empty()) {
        return Trivial();
    }
    const auto parsed = ParseFilterField(field);
    if (!parsed.has_value()) {
        return Trivial();
    }
    return Dispatch(*parsed, values, key, subkey, names);
}

FilterTranslation CombineFilters(const std::vector<FilterTranslation>& translations) {
    std::vector<std::string> clauses;
    FilterTranslation combined;

    for (const auto& t : translations) {
        if (t.IsTrivial()) {
            continue;
        }
        clauses.push_back(absl::StrCat("(", t.where_clause, ")"));
        combined.required_joins.insert(t.required_joins.begin(), t.required_joins.end());
        for (const auto& [name, value] : t.params) {
            combined.params[name] = value;
        }
        combined.uses_exists_subquery = combined.uses_exists_subquery || t.uses_exists_subquery;
    }

    if (!clauses.empty()) {
        combined.where_clause = absl::StrJoin(clauses, " AND ");
    }
    return combined;
}

absl::StatusOr<FilterTranslation> TranslateAllFilters(const FilterSpec& filters,
                                                      ParamNames& names) {
    std::vector<FilterTranslation> translations;
    const std::optional<std::string> none;

    for (const auto& [field, entry] : filters) {
        if (const auto* flat = std::get_if<FilterValues>(&entry)) {
            TRACELENS_ASSIGN_OR_RETURN(auto t, TranslateFilter(field, *flat, none, none, names));
            translations.push_back(std::move(t));
        } else if (const auto* keyed = std::get_if<KeyedFilterValues>(&entry)) {
            for (const auto& [key, values] : *keyed) {
                TRACELENS_ASSIGN_OR_RETURN(
                    auto t, TranslateFilter(field, values, std::optional<std::string>(key), none, names));
                translations.push_back(std::move(t));
            }
        } else if (const auto* nested = std::get_if<SubkeyedFilterValues>(&entry)) {
            for (const auto& [key, by_subkey] : *nested) {
                for (const auto& [subkey, values] : by_subkey) {
                    TRACELENS_ASSIGN_OR_RETURN(
                        auto t, TranslateFilter(field, values, std::optional<std::string>(key),
                                                std::optional<std::string>(subkey), names));
                    translations.push_back(std::move(t));
                }
            }
        }
    }

    return CombineFilters(translations);
}

}  // namespace tracelens::analytics
