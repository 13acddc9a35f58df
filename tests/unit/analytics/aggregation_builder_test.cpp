/// @file aggregation_builder_test.cpp
/// @brief Unit tests for time-series statement assembly

#include <chrono>
#include <regex>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "analytics/aggregation_builder.h"
#include "common/config.h"
#include "common/error.h"

namespace tracelens::analytics {
namespace {

using std::chrono::hours;

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t CountOf(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

MetricSpec Metric(std::string field, AggKind aggregation, int index = 0) {
    MetricSpec spec;
    spec.index = index;
    spec.field = std::move(field);
    spec.aggregation = aggregation;
    return spec;
}

class AggregationBuilderTest : public ::testing::Test {
protected:
    TimeseriesRequest BaseRequest() const {
        TimeseriesRequest request;
        request.tenant_id = "project_1";
        request.current_start = Timestamp(hours(48));
        request.current_end = Timestamp(hours(72));
        request.previous_start = Timestamp(hours(24));
        return request;
    }

    BuiltQuery Build(const TimeseriesRequest& request) const {
        auto result = builder_.BuildTimeseriesQuery(request);
        EXPECT_TRUE(result.ok()) << result.status();
        return result.ok() ? *result : BuiltQuery{};
    }

    AggregationBuilder builder_;
};

// ============================================================================
// Shape selection
// ============================================================================

TEST_F(AggregationBuilderTest, SelectsShapes) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum)};
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kSummary);

    request.granularity_minutes = 60;
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kBucketedSeries);

    request.granularity_minutes.reset();
    request.series.push_back(Metric("threads.average_duration_per_thread", AggKind::kAvg, 1));
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kSubquery);

    request.group_by = "topics.topics";
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kSubquery);
    request.group_by = "metadata.labels";
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kSubquery);
    request.group_by = "metadata.span_type";
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kDedupGrouping);

    request.granularity_minutes = 60;
    request.group_by = "topics.topics";
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kBucketedSeries);
    request.group_by = "metadata.labels";
    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kDedupGrouping);
}

TEST(GroupingTest, DedupForMultiValuedOrChildKeys) {
    EXPECT_TRUE(GroupingNeedsDedup("metadata.labels"));
    EXPECT_TRUE(GroupingNeedsDedup("metadata.model"));
    EXPECT_TRUE(GroupingNeedsDedup("metadata.span_type"));
    EXPECT_TRUE(GroupingNeedsDedup("evaluations.evaluation_passed"));
    EXPECT_FALSE(GroupingNeedsDedup("topics.topics"));
    EXPECT_FALSE(GroupingNeedsDedup("metadata.user_id"));
    EXPECT_FALSE(GroupingNeedsDedup("not.a.field"));

    EXPECT_TRUE(GroupingJoinsChildTable("metadata.span_type"));
    EXPECT_TRUE(GroupingJoinsChildTable("evaluations.evaluation_label"));
    EXPECT_FALSE(GroupingJoinsChildTable("metadata.labels"));
    EXPECT_FALSE(GroupingJoinsChildTable("topics.topics"));
}

// ============================================================================
// Summary shape
// ============================================================================

TEST_F(AggregationBuilderTest, SummaryAlwaysProducesBothPeriods) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum)};

    const BuiltQuery query = Build(request);

    EXPECT_TRUE(Contains(query.sql, "simple_metrics_current AS ("));
    EXPECT_TRUE(Contains(query.sql, "simple_metrics_previous AS ("));
    EXPECT_TRUE(Contains(query.sql, "coalesce(sum(ts.TotalCost), 0) AS `0__performance_total_cost__sum`"));
    EXPECT_TRUE(Contains(query.sql, "'current' AS period"));
    EXPECT_TRUE(Contains(query.sql, "'previous' AS period"));
    EXPECT_TRUE(Contains(query.sql, "UNION ALL"));
    EXPECT_TRUE(Contains(query.sql,
                         "ifNotFinite(coalesce((SELECT `0__performance_total_cost__sum` FROM "
                         "simple_metrics_current), 0), 0)"));
    EXPECT_EQ(query.sql.substr(query.sql.size() - 15), "ORDER BY period");
}

TEST_F(AggregationBuilderTest, SummaryAveragesOfEmptyPeriodsReadZero) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.completion_time", AggKind::kAvg),
                      Metric("threads.average_duration_per_thread", AggKind::kAvg, 1)};

    const BuiltQuery query = Build(request);

    // avg over no rows is nan, which coalesce alone keeps
    EXPECT_TRUE(Contains(query.sql,
                         "ifNotFinite(coalesce((SELECT `0__performance_completion_time__avg` FROM "
                         "simple_metrics_previous), 0), 0) AS `0__performance_completion_time__avg`"));
    EXPECT_TRUE(Contains(query.sql,
                         "ifNotFinite(coalesce((SELECT value FROM "
                         "cte_1__threads_average_duration_per_thread__avg_previous), 0), 0)"));
    EXPECT_FALSE(Contains(query.sql, " coalesce((SELECT"));
}

TEST_F(AggregationBuilderTest, BindsTenantAndWindows) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("metadata.trace_id", AggKind::kCardinality)};

    const BuiltQuery query = Build(request);

    EXPECT_EQ(std::get<std::string>(query.params.at("tenantId")), "project_1");
    EXPECT_EQ(std::get<Timestamp>(query.params.at("currentStart")), request.current_start);
    EXPECT_EQ(std::get<Timestamp>(query.params.at("currentEnd")), request.current_end);
    EXPECT_EQ(std::get<Timestamp>(query.params.at("previousStart")), request.previous_start);
    EXPECT_EQ(std::get<Timestamp>(query.params.at("previousEnd")), request.current_start);
    EXPECT_TRUE(Contains(query.sql, "{tenantId:String}"));
    EXPECT_FALSE(Contains(query.sql, "project_1"));
}

TEST_F(AggregationBuilderTest, ThreadDurationGetsPerPeriodCtes) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum),
                      Metric("threads.average_duration_per_thread", AggKind::kAvg, 1)};

    const BuiltQuery query = Build(request);

    EXPECT_TRUE(Contains(query.sql, "cte_1__threads_average_duration_per_thread__avg_current AS ("));
    EXPECT_TRUE(Contains(query.sql, "cte_1__threads_average_duration_per_thread__avg_previous AS ("));
    EXPECT_TRUE(Contains(query.sql, "avg(thread_duration) AS value"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY thread_id"));
    EXPECT_TRUE(Contains(query.sql, "14400000"));
}

TEST_F(AggregationBuilderTest, PipelineKeptOnlyForFullGranularity) {
    TimeseriesRequest request = BaseRequest();
    MetricSpec per_user = Metric("performance.completion_time", AggKind::kAvg);
    per_user.pipeline = PipelineSpec{"user_id", AggKind::kMax};
    request.series = {per_user, Metric("performance.total_cost", AggKind::kSum, 1)};

    const BuiltQuery summary = Build(request);
    EXPECT_TRUE(Contains(summary.sql, "max(inner_value) AS value"));
    EXPECT_TRUE(Contains(summary.sql, "GROUP BY pipeline_key"));

    request.granularity_minutes = 60;
    const BuiltQuery bucketed = Build(request);
    EXPECT_FALSE(Contains(bucketed.sql, "inner_value"));
    EXPECT_FALSE(Contains(bucketed.sql, "0__performance_completion_time__avg"));
    EXPECT_TRUE(Contains(bucketed.sql, "1__performance_total_cost__sum"));
}

// ============================================================================
// Bucketed shape
// ============================================================================

TEST_F(AggregationBuilderTest, BucketedSeriesGroupsByPeriodAndDate) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.completion_time", AggKind::kP90)};
    request.granularity_minutes = 60;

    const BuiltQuery query = Build(request);

    EXPECT_TRUE(Contains(query.sql, "CASE WHEN ts.CreatedAt >= {currentStart:DateTime64(3)}"));
    EXPECT_TRUE(Contains(query.sql, "THEN 'previous' END AS period"));
    EXPECT_TRUE(Contains(query.sql,
                         "toStartOfInterval(ts.CreatedAt, INTERVAL 1 HOUR, 'UTC') AS date"));
    EXPECT_TRUE(Contains(query.sql, "quantileExact(0.9)(ts.TotalDurationMs)"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY period, date"));
    EXPECT_TRUE(Contains(query.sql, "ORDER BY period, date"));
    EXPECT_TRUE(Contains(query.sql, "LIMIT 1 BY TenantId, TraceId"));
}

TEST_F(AggregationBuilderTest, ExcessiveBucketsBecomeDaily) {
    TimeseriesRequest request = BaseRequest();
    request.current_end = request.current_start + hours(24 * 30);
    request.series = {Metric("performance.total_cost", AggKind::kSum)};
    request.granularity_minutes = 1;

    const BuiltQuery query = Build(request);
    EXPECT_TRUE(Contains(query.sql, "INTERVAL 1 DAY"));
    EXPECT_FALSE(Contains(query.sql, "toStartOfMinute"));
}

TEST_F(AggregationBuilderTest, InvalidTimeZoneFallsBackToDefault) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum)};
    request.granularity_minutes = 60;
    request.time_zone = "UTC'); DROP TABLE trace_summaries; --";

    const BuiltQuery query = Build(request);
    EXPECT_FALSE(Contains(query.sql, "DROP TABLE"));
    EXPECT_TRUE(Contains(query.sql, "INTERVAL 1 HOUR, 'UTC')"));
}

TEST_F(AggregationBuilderTest, ChildMetricsUseOnePreAggregatedJoinPerTable) {
    TimeseriesRequest request = BaseRequest();
    request.granularity_minutes = 1440;
    MetricSpec score = Metric("evaluations.evaluation_score", AggKind::kAvg, 0);
    score.key = "ev-1";
    MetricSpec pass_rate = Metric("evaluations.evaluation_pass_rate", AggKind::kAvg, 1);
    pass_rate.key = "ev-1";
    request.series = {score, pass_rate, Metric("sentiment.thumbs_up_down", AggKind::kSum, 2)};

    const BuiltQuery query = Build(request);

    EXPECT_EQ(CountOf(query.sql, "FROM evaluation_runs"), 1u);
    EXPECT_EQ(CountOf(query.sql, "FROM stored_spans"), 1u);
    EXPECT_TRUE(Contains(query.sql, "avgIfMerge(es.m0)"));
    EXPECT_TRUE(Contains(query.sql, "avgIfMerge(es.m1)"));
    EXPECT_TRUE(Contains(query.sql, "coalesce(sumArrayMerge(ss.m2), 0)"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY TenantId, TraceId"));
    EXPECT_TRUE(Contains(query.sql, ") AS es ON es.TenantId = ts.TenantId AND es.TraceId = ts.TraceId"));
    EXPECT_EQ(std::get<std::string>(query.params.at("evaluatorId_0")), "ev-1");
    EXPECT_EQ(std::get<std::string>(query.params.at("evaluatorId_1")), "ev-1");
}

TEST_F(AggregationBuilderTest, BucketedGroupingNormalizesEmptyKeys) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("metadata.trace_id", AggKind::kCardinality)};
    request.group_by = "metadata.user_id";

    const BuiltQuery query = Build(request);
    EXPECT_TRUE(Contains(query.sql, "'unknown', ts.Attributes['langwatch.user_id']) AS group_key"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY period, group_key"));
    EXPECT_FALSE(Contains(query.sql, "HAVING"));
}

// ============================================================================
// Deduplicated grouping shape
// ============================================================================

TEST_F(AggregationBuilderTest, LabelsGroupingUsesDedupCte) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("metadata.trace_id", AggKind::kCardinality),
                      Metric("performance.total_cost", AggKind::kSum, 1)};
    request.group_by = "metadata.labels";

    const BuiltQuery query = Build(request);

    EXPECT_EQ(query.sql.rfind("WITH deduped AS (\nSELECT DISTINCT ts.TraceId AS trace_id", 0), 0u);
    EXPECT_TRUE(Contains(query.sql, "arrayJoin(arrayDistinct(JSONExtract("
                                    "ts.Attributes['langwatch.labels'], 'Array(String)'))) "
                                    "AS group_key"));
    EXPECT_TRUE(Contains(query.sql, "uniqExact(trace_id) AS `0__metadata_trace_id__cardinality`"));
    EXPECT_TRUE(Contains(query.sql, "coalesce(sum(total_cost), 0) AS `1__performance_total_cost__sum`"));
    EXPECT_TRUE(Contains(query.sql, "FROM deduped"));
    EXPECT_TRUE(Contains(query.sql, "HAVING group_key != ''"));
}

TEST_F(AggregationBuilderTest, SpanTypeGroupingJoinsSpansInsideCte) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("metadata.trace_id", AggKind::kCardinality)};
    request.group_by = "metadata.span_type";
    request.granularity_minutes = 1440;

    const BuiltQuery query = Build(request);

    EXPECT_TRUE(Contains(query.sql, "LEFT JOIN stored_spans ss ON ss.TenantId = ts.TenantId"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY period, date, group_key"));
    EXPECT_FALSE(Contains(query.sql, "HAVING"));
}

TEST_F(AggregationBuilderTest, EvaluationGroupingScopedToEvaluator) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("metadata.trace_id", AggKind::kCardinality),
                      Metric("evaluations.evaluation_score", AggKind::kAvg, 1)};
    request.group_by = "evaluations.evaluation_passed";
    request.group_by_key = "ev'1";

    const BuiltQuery query = Build(request);

    EXPECT_TRUE(Contains(query.sql, "es.EvaluatorId = {groupEvaluatorId_"));
    EXPECT_FALSE(Contains(query.sql, "ev'1"));
    EXPECT_TRUE(Contains(query.sql,
                         "avgIfMerge(es.m1) AS `1__evaluations_evaluation_score__avg`"));
    EXPECT_TRUE(Contains(query.sql, "FROM deduped\nLEFT JOIN (\nSELECT TenantId,\n  TraceId,\n  "
                                    "avgIfState(Score, Status = 'processed') AS m1"));
    EXPECT_TRUE(Contains(query.sql, ") AS es ON es.TraceId = deduped.trace_id"));
}

TEST_F(AggregationBuilderTest, ModelGroupingKeepsChildTableMetrics) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("evaluations.evaluation_score", AggKind::kAvg),
                      Metric("sentiment.thumbs_up_down", AggKind::kSum, 1),
                      Metric("evaluations.evaluation_runs", AggKind::kSum, 2),
                      Metric("topics.topics", AggKind::kCardinality, 3)};
    request.group_by = "metadata.model";
    request.granularity_minutes = 1440;

    const BuiltQuery query = Build(request);

    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kDedupGrouping);
    EXPECT_TRUE(Contains(query.sql, "arrayJoin(arrayDistinct(ts.Models)) AS group_key"));
    EXPECT_TRUE(Contains(query.sql, "avgIfMerge(es.m0) AS `0__evaluations_evaluation_score__avg`"));
    EXPECT_TRUE(Contains(query.sql,
                         "coalesce(sumArrayMerge(ss.m1), 0) AS `1__sentiment_thumbs_up_down__sum`"));
    EXPECT_TRUE(Contains(query.sql, "uniqMerge(es.m2) AS `2__evaluations_evaluation_runs__sum`"));
    EXPECT_TRUE(Contains(query.sql, "uniqIf(topic_id, topic_id != '') AS `3__topics_topics__cardinality`"));
    EXPECT_EQ(CountOf(query.sql, "FROM evaluation_runs"), 1u);
    EXPECT_EQ(CountOf(query.sql, "FROM stored_spans"), 1u);
    EXPECT_TRUE(Contains(query.sql, ") AS es ON es.TraceId = deduped.trace_id"));
    EXPECT_TRUE(Contains(query.sql, ") AS ss ON ss.TraceId = deduped.trace_id"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY period, date, group_key"));
}

// ============================================================================
// Grouped per-period shape
// ============================================================================

TEST_F(AggregationBuilderTest, GroupedFullGranularityKeepsTwoLevelMetrics) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum),
                      Metric("threads.average_duration_per_thread", AggKind::kAvg, 1)};
    request.group_by = "topics.topics";

    const BuiltQuery query = Build(request);
    const std::string thread_cte = "cte_1__threads_average_duration_per_thread__avg_current";

    EXPECT_TRUE(Contains(query.sql, thread_cte + " AS ("));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY thread_id, group_key"));
    EXPECT_TRUE(Contains(query.sql, "SELECT group_key,\n  avg(thread_duration) AS value"));
    EXPECT_TRUE(Contains(query.sql, "SELECT group_key FROM simple_metrics_current\n"
                                    "UNION DISTINCT\nSELECT group_key FROM " + thread_cte));
    EXPECT_TRUE(Contains(query.sql, "LEFT JOIN " + thread_cte + " ON " + thread_cte +
                                        ".group_key = keys.group_key"));
    EXPECT_TRUE(Contains(query.sql, "ifNotFinite(coalesce(" + thread_cte + ".value, 0), 0)"));
    EXPECT_TRUE(Contains(query.sql,
                         "ifNotFinite(coalesce(simple_metrics_previous.`0__performance_total_cost__sum`"
                         ", 0), 0)"));
    EXPECT_TRUE(Contains(query.sql, "'previous' AS period"));
    EXPECT_EQ(query.sql.substr(query.sql.size() - 26), "ORDER BY period, group_key");
}

TEST_F(AggregationBuilderTest, GroupedPipelineDropsEmptyUnnestedKeys) {
    TimeseriesRequest request = BaseRequest();
    MetricSpec per_user = Metric("performance.total_cost", AggKind::kSum);
    per_user.pipeline = PipelineSpec{"user_id", AggKind::kAvg};
    request.series = {per_user};
    request.group_by = "metadata.labels";

    const BuiltQuery query = Build(request);

    EXPECT_EQ(AggregationBuilder::SelectQueryShape(request), QueryShape::kSubquery);
    EXPECT_TRUE(Contains(query.sql, "avg(inner_value) AS value"));
    EXPECT_TRUE(Contains(query.sql, "GROUP BY pipeline_key, group_key"));
    EXPECT_TRUE(Contains(query.sql, "WHERE group_key != ''"));
    EXPECT_FALSE(Contains(query.sql, "simple_metrics_"));
}

// ============================================================================
// Validation, safety and determinism
// ============================================================================

TEST_F(AggregationBuilderTest, RejectsInconsistentRequests) {
    TimeseriesRequest no_tenant = BaseRequest();
    no_tenant.tenant_id.clear();
    EXPECT_EQ(builder_.BuildTimeseriesQuery(no_tenant).status().code(),
              absl::StatusCode::kInvalidArgument);

    TimeseriesRequest inverted = BaseRequest();
    inverted.current_end = inverted.current_start;
    EXPECT_FALSE(builder_.BuildTimeseriesQuery(inverted).ok());

    TimeseriesRequest late_previous = BaseRequest();
    late_previous.previous_start = late_previous.current_end;
    EXPECT_FALSE(builder_.BuildTimeseriesQuery(late_previous).ok());

    TimeseriesRequest zero_granularity = BaseRequest();
    zero_granularity.granularity_minutes = 0;
    EXPECT_FALSE(builder_.BuildTimeseriesQuery(zero_granularity).ok());
}

TEST_F(AggregationBuilderTest, RejectsRepeatedSeriesIndex) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum, 3),
                      Metric("performance.total_cost", AggKind::kSum, 3)};

    auto result = builder_.BuildTimeseriesQuery(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);

    request.series[1].index = 4;
    EXPECT_TRUE(builder_.BuildTimeseriesQuery(request).ok());
}

TEST_F(AggregationBuilderTest, MalformedRangeFilterFails) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("performance.total_cost", AggKind::kSum)};
    request.filters["evaluations.score"] = FilterValues{"low", "high"};

    auto result = builder_.BuildTimeseriesQuery(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(AggregationBuilderTest, UnsupportedMetricFailsWholeRequest) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("events.event_details", AggKind::kAvg)};

    auto result = builder_.BuildTimeseriesQuery(request);
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsUnsupportedMetric(result.status()));
}

TEST_F(AggregationBuilderTest, CallerValuesOnlyReachParams) {
    const std::string hostile = "x'; DROP TABLE trace_summaries; --";
    TimeseriesRequest request = BaseRequest();
    request.tenant_id = hostile;
    MetricSpec metric = Metric("events.event_score", AggKind::kAvg);
    metric.key = hostile;
    metric.subkey = hostile;
    request.series = {metric};
    request.filters["topics.topics"] = FilterValues{hostile};
    request.filters["metadata.value"] = KeyedFilterValues{{hostile, {hostile}}};
    request.filters["evaluations.label"] = KeyedFilterValues{{hostile, {hostile}}};
    request.granularity_minutes = 60;

    const BuiltQuery query = Build(request);
    EXPECT_FALSE(Contains(query.sql, "DROP TABLE"));
}

TEST_F(AggregationBuilderTest, DeterministicAcrossCalls) {
    TimeseriesRequest request = BaseRequest();
    request.series = {Metric("evaluations.evaluation_score", AggKind::kAvg),
                      Metric("metadata.user_id", AggKind::kCardinality, 1)};
    request.filters["spans.model"] = FilterValues{"gpt-4"};
    request.filters["topics.topics"] = FilterValues{"a"};
    request.granularity_minutes = 30;

    const BuiltQuery first = Build(request);
    const BuiltQuery second = Build(request);
    EXPECT_EQ(first.sql, second.sql);
    EXPECT_EQ(first.params.size(), second.params.size());
}

TEST_F(AggregationBuilderTest, ParamNamesAreUniqueAcrossFiltersAndMetrics) {
    TimeseriesRequest request = BaseRequest();
    MetricSpec score = Metric("evaluations.evaluation_score", AggKind::kAvg);
    score.key = "ev-metric";
    request.series = {score};
    request.filters["evaluations.passed"] = KeyedFilterValues{{"ev-filter", {"true"}}};

    const BuiltQuery query = Build(request);

    std::set<std::string> bound_ids;
    for (const auto& [name, value] : query.params) {
        if (name.rfind("evaluatorId_", 0) == 0) {
            bound_ids.insert(std::get<std::string>(value));
        }
    }
    EXPECT_EQ(bound_ids, (std::set<std::string>{"ev-filter", "ev-metric"}));
}

TEST_F(AggregationBuilderTest, EveryPlaceholderIsBound) {
    TimeseriesRequest request = BaseRequest();
    MetricSpec per_thread = Metric("threads.average_duration_per_thread", AggKind::kAvg, 2);
    per_thread.pipeline = PipelineSpec{"customer_id", AggKind::kAvg};
    MetricSpec votes = Metric("events.event_type", AggKind::kSum, 1);
    votes.key = "thumbs_up_down";
    request.series = {Metric("evaluations.evaluation_runs", AggKind::kAvg), votes, per_thread};
    request.filters["metadata.user_id"] = FilterValues{"u1"};
    request.filters["events.metrics.value"] =
        SubkeyedFilterValues{{"thumbs_up_down", {{"vote", {"0", "1"}}}}};

    const BuiltQuery query = Build(request);

    const std::regex placeholder(R"(\{([A-Za-z0-9_]+):[^}]+\})");
    for (std::sregex_iterator it(query.sql.begin(), query.sql.end(), placeholder), end;
         it != end; ++it) {
        EXPECT_EQ(query.params.count((*it)[1].str()), 1u) << (*it)[1].str();
    }
}

// ============================================================================
// Options
// ============================================================================

TEST(CompilerOptionsTest, ReadsAnalyticsSection) {
    auto config = Config::LoadFromString(R"(
analytics:
  default_time_zone: UTC
  max_buckets: 50
  feedbacks_limit: 5
)");
    ASSERT_TRUE(config.ok());

    const CompilerOptions options = CompilerOptions::FromConfig(*config);
    EXPECT_EQ(options.default_time_zone, "UTC");
    EXPECT_EQ(options.max_buckets, 50);
    EXPECT_EQ(options.feedbacks_limit, 5);
    EXPECT_EQ(options.max_filter_options, 10000);
    EXPECT_EQ(options.top_documents_limit, 10);
}

TEST(CompilerOptionsTest, InvalidDefaultZoneBecomesUtc) {
    CompilerOptions options;
    options.default_time_zone = "Not/AZone";
    AggregationBuilder builder(options);
    EXPECT_EQ(builder.options().default_time_zone, "UTC");
}

}  // namespace
}  // namespace tracelens::analytics
