/// @file request_json.cpp
/// @brief JSON request decoding and query encoding

#include "analytics/request_json.h"

#include <chrono>
#include <optional>
#include <type_traits>
#include <variant>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "common/error.h"

namespace tracelens::analytics {

using json = nlohmann::json;

namespace {

absl::StatusOr<Timestamp> ParseTimestamp(const json& document, const char* name) {
    if (!document.contains(name)) {
        return InvalidArgumentError(absl::StrCat("missing '", name, "'"));
    }
    const json& value = document.at(name);
    if (!value.is_number_integer()) {
        return InvalidArgumentError(absl::StrCat("'", name, "' must be epoch milliseconds"));
    }
    return Timestamp(std::chrono::milliseconds(value.get<int64_t>()));
}

std::optional<std::string> OptionalString(const json& document, const char* name) {
    if (!document.contains(name) || document.at(name).is_null()) {
        return std::nullopt;
    }
    return document.at(name).get<std::string>();
}

/// "tenantId", or the older "projectId"
absl::StatusOr<std::string> ParseTenant(const json& document) {
    for (const char* name : {"tenantId", "projectId"}) {
        if (document.contains(name)) {
            return document.at(name).get<std::string>();
        }
    }
    return InvalidArgumentError("missing 'tenantId'");
}

absl::StatusOr<AggKind> ParseAggregation(const json& document) {
    const std::string name = document.value("aggregation", "");
    auto kind = ParseAggKind(name);
    if (!kind.has_value()) {
        return InvalidArgumentError(absl::StrCat("unknown aggregation '", name, "'"));
    }
    return *kind;
}

absl::StatusOr<MetricSpec> ParseMetric(const json& document, int index) {
    if (!document.is_object()) {
        return InvalidArgumentError(absl::StrCat("series[", index, "] must be an object"));
    }
    MetricSpec metric;
    metric.index = index;
    metric.field = document.contains("metric") ? document.at("metric").get<std::string>()
                                                : document.value("field", "");
    if (metric.field.empty()) {
        return InvalidArgumentError(absl::StrCat("series[", index, "] has no metric"));
    }
    TRACELENS_ASSIGN_OR_RETURN(metric.aggregation, ParseAggregation(document));
    metric.key = OptionalString(document, "key");
    metric.subkey = OptionalString(document, "subkey");

    if (document.contains("pipeline") && !document.at("pipeline").is_null()) {
        const json& pipeline = document.at("pipeline");
        PipelineSpec spec;
        spec.field = pipeline.value("field", "");
        TRACELENS_ASSIGN_OR_RETURN(spec.aggregation, ParseAggregation(pipeline));
        metric.pipeline = spec;
    }
    return metric;
}

absl::StatusOr<FilterValues> ParseValueList(const json& values, const std::string& field) {
    if (!values.is_array()) {
        return InvalidArgumentError(
            absl::StrCat("filter '", field, "' must nest arrays of strings"));
    }
    return values.get<FilterValues>();
}

absl::StatusOr<FilterEntry> ParseFilterEntry(const json& value, const std::string& field) {
    if (value.is_array()) {
        TRACELENS_ASSIGN_OR_RETURN(FilterValues values, ParseValueList(value, field));
        return FilterEntry(std::move(values));
    }
    if (!value.is_object()) {
        return InvalidArgumentError(absl::StrCat("filter '", field, "' has an invalid shape"));
    }

    // The first nested value decides between the keyed and subkeyed shapes.
    const bool subkeyed = !value.empty() && value.begin()->is_object();
    if (!subkeyed) {
        KeyedFilterValues keyed;
        for (const auto& [key, values] : value.items()) {
            TRACELENS_ASSIGN_OR_RETURN(keyed[key], ParseValueList(values, field));
        }
        return FilterEntry(std::move(keyed));
    }

    SubkeyedFilterValues nested;
    for (const auto& [key, by_subkey] : value.items()) {
        if (!by_subkey.is_object()) {
            return InvalidArgumentError(absl::StrCat("filter '", field, "' mixes nesting shapes"));
        }
        for (const auto& [subkey, values] : by_subkey.items()) {
            TRACELENS_ASSIGN_OR_RETURN(nested[key][subkey], ParseValueList(values, field));
        }
    }
    return FilterEntry(std::move(nested));
}

absl::StatusOr<FilterSpec> ParseFilters(const json& document) {
    if (!document.contains("filters") || document.at("filters").is_null()) {
        return FilterSpec{};
    }
    return ParseFilterSpec(document.at("filters"));
}

absl::Status ParseObject(const std::string& text, json& document) {
    document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return InvalidArgumentError("request is not valid JSON");
    }
    if (!document.is_object()) {
        return InvalidArgumentError("request must be a JSON object");
    }
    return absl::OkStatus();
}

std::string FormatTimestamp(Timestamp timestamp) {
    return absl::FormatTime("%Y-%m-%d %H:%M:%E3S", absl::FromChrono(timestamp),
                            absl::UTCTimeZone());
}

}  // namespace

absl::StatusOr<FilterSpec> ParseFilterSpec(const json& filters) {
    if (!filters.is_object()) {
        return InvalidArgumentError("'filters' must be an object");
    }
    FilterSpec spec;
    for (const auto& [field, value] : filters.items()) {
        TRACELENS_ASSIGN_OR_RETURN(spec[field], ParseFilterEntry(value, field));
    }
    return spec;
}

absl::StatusOr<TimeseriesRequest> ParseTimeseriesRequest(const std::string& text) {
    json document;
    TRACELENS_RETURN_IF_ERROR(ParseObject(text, document));
    try {
        TimeseriesRequest request;
        TRACELENS_ASSIGN_OR_RETURN(request.tenant_id, ParseTenant(document));
        TRACELENS_ASSIGN_OR_RETURN(request.current_start, ParseTimestamp(document, "startDate"));
        TRACELENS_ASSIGN_OR_RETURN(request.current_end, ParseTimestamp(document, "endDate"));
        TRACELENS_ASSIGN_OR_RETURN(request.previous_start,
                                   ParseTimestamp(document, "previousPeriodStartDate"));

        if (document.contains("series")) {
            int index = 0;
            for (const auto& entry : document.at("series")) {
                TRACELENS_ASSIGN_OR_RETURN(MetricSpec metric, ParseMetric(entry, index++));
                request.series.push_back(std::move(metric));
            }
        }

        TRACELENS_ASSIGN_OR_RETURN(request.filters, ParseFilters(document));
        request.group_by = OptionalString(document, "groupBy");
        request.group_by_key = OptionalString(document, "groupByKey");
        request.time_zone = OptionalString(document, "timeZone");

        // "granularity" is accepted as an alias of "timeScale".
        const char* scale_key = document.contains("timeScale") ? "timeScale" : "granularity";
        if (document.contains(scale_key)) {
            const json& scale = document.at(scale_key);
            if (scale.is_number_integer()) {
                request.granularity_minutes = scale.get<int64_t>();
            } else if (!(scale.is_string() && scale.get<std::string>() == "full")) {
                return InvalidArgumentError(
                    absl::StrCat("'", scale_key, "' must be minutes or \"full\""));
            }
        }
        return request;
    } catch (const json::exception& e) {
        return InvalidArgumentError(absl::StrCat("Failed to parse timeseries request: ", e.what()));
    }
}

absl::StatusOr<FilterOptionsRequest> ParseFilterOptionsRequest(const std::string& text) {
    json document;
    TRACELENS_RETURN_IF_ERROR(ParseObject(text, document));
    try {
        FilterOptionsRequest request;
        TRACELENS_ASSIGN_OR_RETURN(request.tenant_id, ParseTenant(document));
        request.field = document.value("field", "");
        if (request.field.empty()) {
            return InvalidArgumentError("missing 'field'");
        }
        TRACELENS_ASSIGN_OR_RETURN(request.start, ParseTimestamp(document, "startDate"));
        TRACELENS_ASSIGN_OR_RETURN(request.end, ParseTimestamp(document, "endDate"));
        request.key = OptionalString(document, "key");
        request.subkey = OptionalString(document, "subkey");
        request.search = OptionalString(document, "query");
        TRACELENS_ASSIGN_OR_RETURN(request.filters, ParseFilters(document));
        return request;
    } catch (const json::exception& e) {
        return InvalidArgumentError(
            absl::StrCat("Failed to parse filter options request: ", e.what()));
    }
}

absl::StatusOr<DocumentsRequest> ParseDocumentsRequest(const std::string& text) {
    json document;
    TRACELENS_RETURN_IF_ERROR(ParseObject(text, document));
    try {
        DocumentsRequest request;
        TRACELENS_ASSIGN_OR_RETURN(request.tenant_id, ParseTenant(document));
        TRACELENS_ASSIGN_OR_RETURN(request.start, ParseTimestamp(document, "startDate"));
        TRACELENS_ASSIGN_OR_RETURN(request.end, ParseTimestamp(document, "endDate"));
        TRACELENS_ASSIGN_OR_RETURN(request.filters, ParseFilters(document));
        return request;
    } catch (const json::exception& e) {
        return InvalidArgumentError(absl::StrCat("Failed to parse documents request: ", e.what()));
    }
}

json ParamsToJson(const ParamMap& params) {
    json result = json::object();
    for (const auto& [name, value] : params) {
        result[name] = std::visit(
            [](const auto& v) -> json {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Timestamp>) {
                    return FormatTimestamp(v);
                } else {
                    return v;
                }
            },
            value);
    }
    return result;
}

json BuiltQueryToJson(const BuiltQuery& query) {
    json j;
    j["sql"] = query.sql;
    j["params"] = ParamsToJson(query.params);
    return j;
}

json TopDocumentsQueryToJson(const TopDocumentsQuery& query) {
    json j;
    j["documentsSql"] = query.documents_sql;
    j["totalSql"] = query.total_sql;
    j["params"] = ParamsToJson(query.params);
    return j;
}

}  // namespace tracelens::analytics
