/// @file request_json_test.cpp
/// @brief Unit tests for request decoding and query encoding

#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "analytics/request_json.h"

namespace tracelens::analytics {
namespace {

TEST(RequestJsonTest, ParsesTimeseriesRequest) {
    const std::string text = R"({
        "tenantId": "project_1",
        "startDate": 1717200000000,
        "endDate": 1717286400000,
        "previousPeriodStartDate": 1717113600000,
        "series": [
            {"metric": "performance.completion_time", "aggregation": "p95"},
            {"metric": "evaluations.evaluation_score", "aggregation": "avg", "key": "ev-1",
             "pipeline": {"field": "user_id", "aggregation": "max"}}
        ],
        "groupBy": "metadata.labels",
        "timeScale": 60,
        "timeZone": "Europe/Amsterdam"
    })";

    auto result = ParseTimeseriesRequest(text);
    ASSERT_TRUE(result.ok()) << result.status();

    EXPECT_EQ(result->tenant_id, "project_1");
    EXPECT_EQ(result->current_start, Timestamp(std::chrono::milliseconds(1717200000000)));
    EXPECT_EQ(result->previous_start, Timestamp(std::chrono::milliseconds(1717113600000)));
    ASSERT_EQ(result->series.size(), 2u);
    EXPECT_EQ(result->series[0].index, 0);
    EXPECT_EQ(result->series[0].aggregation, AggKind::kP95);
    EXPECT_EQ(result->series[1].index, 1);
    EXPECT_EQ(result->series[1].key, "ev-1");
    ASSERT_TRUE(result->series[1].pipeline.has_value());
    EXPECT_EQ(result->series[1].pipeline->field, "user_id");
    EXPECT_EQ(result->series[1].pipeline->aggregation, AggKind::kMax);
    EXPECT_EQ(result->group_by, "metadata.labels");
    EXPECT_EQ(result->granularity_minutes, 60);
    EXPECT_EQ(result->time_zone, "Europe/Amsterdam");
}

TEST(RequestJsonTest, FullTimeScaleAndProjectIdAlias) {
    auto result = ParseTimeseriesRequest(R"({
        "projectId": "p", "startDate": 2, "endDate": 3, "previousPeriodStartDate": 1,
        "timeScale": "full"
    })");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->tenant_id, "p");
    EXPECT_FALSE(result->granularity_minutes.has_value());
    EXPECT_TRUE(result->series.empty());
}

TEST(RequestJsonTest, GranularityAlias) {
    auto result = ParseTimeseriesRequest(R"({
        "tenantId": "p", "startDate": 2, "endDate": 3, "previousPeriodStartDate": 1,
        "granularity": 15
    })");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->granularity_minutes, 15);
}

TEST(RequestJsonTest, ParsesAllFilterShapes) {
    auto filters = ParseFilterSpec(nlohmann::json::parse(R"({
        "topics.topics": ["a", "b"],
        "evaluations.passed": {"ev-1": ["true"]},
        "events.metrics.value": {"thumbs_up_down": {"vote": ["0", "1"]}}
    })"));
    ASSERT_TRUE(filters.ok()) << filters.status();

    EXPECT_EQ(std::get<FilterValues>(filters->at("topics.topics")),
              (FilterValues{"a", "b"}));
    EXPECT_EQ(std::get<KeyedFilterValues>(filters->at("evaluations.passed")).at("ev-1"),
              (FilterValues{"true"}));
    EXPECT_EQ(std::get<SubkeyedFilterValues>(filters->at("events.metrics.value"))
                  .at("thumbs_up_down").at("vote"),
              (FilterValues{"0", "1"}));
}

TEST(RequestJsonTest, RejectsMalformedDocuments) {
    EXPECT_EQ(ParseTimeseriesRequest("{not json").status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_FALSE(ParseTimeseriesRequest("[]").ok());
    // missing previousPeriodStartDate
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": "p", "startDate": 1, "endDate": 2})").ok());
    // timestamps must be epoch milliseconds
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": "p", "startDate": "2024-01-01", "endDate": 2,
            "previousPeriodStartDate": 0})").ok());
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": "p", "startDate": 1, "endDate": 2, "previousPeriodStartDate": 0,
            "series": [{"metric": "x", "aggregation": "mode"}]})").ok());
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": "p", "startDate": 1, "endDate": 2, "previousPeriodStartDate": 0,
            "timeScale": "weekly"})").ok());
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": "p", "startDate": 1, "endDate": 2, "previousPeriodStartDate": 0,
            "filters": {"topics.topics": "a"}})").ok());
    EXPECT_FALSE(ParseTimeseriesRequest(
        R"({"tenantId": 5, "startDate": 1, "endDate": 2, "previousPeriodStartDate": 0})").ok());
}

TEST(RequestJsonTest, ParsesFilterOptionsRequest) {
    auto result = ParseFilterOptionsRequest(R"({
        "tenantId": "p", "field": "metadata.value", "key": "plan",
        "query": "pro", "startDate": 1, "endDate": 2,
        "filters": {"topics.topics": ["t"]}
    })");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->field, "metadata.value");
    EXPECT_EQ(result->key, "plan");
    EXPECT_EQ(result->search, "pro");
    EXPECT_EQ(result->filters.size(), 1u);

    EXPECT_FALSE(ParseFilterOptionsRequest(R"({"tenantId": "p", "startDate": 1, "endDate": 2})").ok());
}

TEST(RequestJsonTest, ParsesDocumentsRequest) {
    auto result = ParseDocumentsRequest(R"({"tenantId": "p", "startDate": 1, "endDate": 2})");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->tenant_id, "p");
    EXPECT_TRUE(result->filters.empty());
}

TEST(RequestJsonTest, EncodesTypedParams) {
    BuiltQuery query;
    query.sql = "SELECT 1";
    query.params = {
        {"tenantId", std::string("p")},
        {"limit", int64_t{5}},
        {"scoreMin", 0.25},
        {"ids", std::vector<std::string>{"a", "b"}},
        {"flags", std::vector<int64_t>{1}},
        {"start", Timestamp(std::chrono::milliseconds(1717200000123))},
    };

    const nlohmann::json j = BuiltQueryToJson(query);
    EXPECT_EQ(j["sql"], "SELECT 1");
    EXPECT_EQ(j["params"]["tenantId"], "p");
    EXPECT_EQ(j["params"]["limit"], 5);
    EXPECT_DOUBLE_EQ(j["params"]["scoreMin"].get<double>(), 0.25);
    EXPECT_EQ(j["params"]["ids"], nlohmann::json::array({"a", "b"}));
    EXPECT_EQ(j["params"]["flags"], nlohmann::json::array({1}));
    EXPECT_EQ(j["params"]["start"], "2024-06-01 00:00:00.123");
}

TEST(RequestJsonTest, EncodesTopDocumentsQuery) {
    TopDocumentsQuery query;
    query.documents_sql = "SELECT documents";
    query.total_sql = "SELECT total";
    query.params = {{"tenantId", std::string("p")}};

    const nlohmann::json j = TopDocumentsQueryToJson(query);
    EXPECT_EQ(j["documentsSql"], "SELECT documents");
    EXPECT_EQ(j["totalSql"], "SELECT total");
    EXPECT_EQ(j["params"]["tenantId"], "p");
}

}  // namespace
}  // namespace tracelens::analytics
