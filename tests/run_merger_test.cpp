#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "metrics/run_merger.h"

namespace {

EndpointMetrics metrics_row(const std::string& endpoint, size_t total, size_t successes,
                            int64_t duration_ms, double avg) {
    EndpointMetrics m;
    m.endpoint = endpoint;
    m.total_requests = total;
    m.successes = successes;
    m.failures = total - successes;
    m.run_duration_ms = duration_ms;
    m.throughput_req_per_sec = throughput(successes, duration_ms);
    m.latency.avg = avg;
    m.latency.min = avg;
    m.latency.max = avg;
    return m;
}

RunSummary run_of(int index, int64_t duration_ms, std::vector<EndpointMetrics> metrics) {
    RunSummary run;
    run.run_index = index;
    run.duration_ms = duration_ms;
    run.metrics = std::move(metrics);
    return run;
}

}  // namespace

TEST(RunMergerTest, ThroughputRecomputedOverSummedDuration) {
    std::vector<RunSummary> runs{
        run_of(1, 1000, {metrics_row("/a", 5, 5, 1000, 10)}),
        run_of(2, 1000, {metrics_row("/a", 5, 5, 1000, 10)})};

    GlobalSummary summary = merge_runs(runs);
    ASSERT_EQ(summary.metrics.size(), 1u);
    EXPECT_EQ(summary.runs, 2u);
    EXPECT_EQ(summary.duration_ms, 2000);
    EXPECT_EQ(summary.metrics[0].total_requests, 10u);
    EXPECT_EQ(summary.metrics[0].successes, 10u);
    EXPECT_EQ(summary.metrics[0].run_duration_ms, 2000);
    EXPECT_DOUBLE_EQ(summary.metrics[0].throughput_req_per_sec, 5.0);
}

TEST(RunMergerTest, CountsAreSummedPerEndpoint) {
    std::vector<RunSummary> runs{
        run_of(1, 500, {metrics_row("/a", 4, 3, 500, 1), metrics_row("/b", 6, 1, 500, 2)}),
        run_of(2, 700, {metrics_row("/a", 2, 0, 700, 1), metrics_row("/b", 1, 1, 700, 2)})};

    GlobalSummary summary = merge_runs(runs);
    ASSERT_EQ(summary.metrics.size(), 2u);

    EXPECT_EQ(summary.metrics[0].endpoint, "/a");
    EXPECT_EQ(summary.metrics[0].total_requests, 6u);
    EXPECT_EQ(summary.metrics[0].successes, 3u);
    EXPECT_EQ(summary.metrics[0].failures, 3u);

    EXPECT_EQ(summary.metrics[1].endpoint, "/b");
    EXPECT_EQ(summary.metrics[1].total_requests, 7u);
    EXPECT_EQ(summary.metrics[1].successes, 2u);
    EXPECT_EQ(summary.metrics[1].failures, 5u);
    EXPECT_DOUBLE_EQ(summary.metrics[1].throughput_req_per_sec, 1.67);
    EXPECT_EQ(summary.duration_ms, 1200);
}

TEST(RunMergerTest, RepeatAverageRebuildsSampleFromRunAverages) {
    // run 1: 3 requests averaging 10ms, run 2: 1 request at 50ms
    std::vector<RunSummary> runs{
        run_of(1, 1000, {metrics_row("/a", 3, 3, 1000, 10)}),
        run_of(2, 1000, {metrics_row("/a", 1, 1, 1000, 50)})};
    runs[0].latency_samples["/a"] = {1, 2, 27};
    runs[1].latency_samples["/a"] = {50};

    GlobalSummary summary = merge_runs(runs, LatencyMergePolicy::REPEAT_AVERAGE);
    ASSERT_EQ(summary.metrics.size(), 1u);
    const LatencyStats& l = summary.metrics[0].latency;
    // reconstructed sample: {10, 10, 10, 50}
    EXPECT_EQ(l.min, 10);
    EXPECT_EQ(l.max, 50);
    EXPECT_EQ(l.avg, 20);
    EXPECT_EQ(l.p50, 10);
    EXPECT_EQ(l.p90, 50);
    EXPECT_EQ(l.p99, 50);
}

TEST(RunMergerTest, RetainedSamplesGiveExactStatistics) {
    std::vector<RunSummary> runs{
        run_of(1, 1000, {metrics_row("/a", 3, 3, 1000, 10)}),
        run_of(2, 1000, {metrics_row("/a", 1, 1, 1000, 50)})};
    runs[0].latency_samples["/a"] = {1, 2, 27};
    runs[1].latency_samples["/a"] = {50};

    GlobalSummary summary = merge_runs(runs, LatencyMergePolicy::RETAINED_SAMPLES);
    ASSERT_EQ(summary.metrics.size(), 1u);
    const LatencyStats& l = summary.metrics[0].latency;
    EXPECT_EQ(l.min, 1);
    EXPECT_EQ(l.max, 50);
    EXPECT_EQ(l.avg, 20);
    EXPECT_EQ(l.p50, 2);
    EXPECT_EQ(l.p90, 50);
}

TEST(RunMergerTest, EndpointNeverHitStaysZero) {
    std::vector<RunSummary> runs{
        run_of(1, 1000, {metrics_row("/a", 2, 2, 1000, 4), metrics_row("/b", 0, 0, 1000, 0)}),
        run_of(2, 1000, {metrics_row("/a", 2, 2, 1000, 6), metrics_row("/b", 0, 0, 1000, 0)})};

    GlobalSummary summary = merge_runs(runs);
    ASSERT_EQ(summary.metrics.size(), 2u);
    const EndpointMetrics& b = summary.metrics[1];
    EXPECT_EQ(b.endpoint, "/b");
    EXPECT_EQ(b.total_requests, 0u);
    EXPECT_EQ(b.throughput_req_per_sec, 0);
    EXPECT_EQ(b.latency.avg, 0);
    EXPECT_EQ(b.latency.p99, 0);

    EXPECT_EQ(summary.metrics[0].latency.avg, 5);
}

TEST(RunMergerTest, NoRunsGivesEmptySummary) {
    GlobalSummary summary = merge_runs({});
    EXPECT_EQ(summary.runs, 0u);
    EXPECT_EQ(summary.duration_ms, 0);
    EXPECT_TRUE(summary.metrics.empty());
}

TEST(RunMergerTest, ZeroDurationRunsGiveZeroThroughput) {
    std::vector<RunSummary> runs{run_of(1, 0, {metrics_row("/a", 0, 0, 0, 0)})};
    GlobalSummary summary = merge_runs(runs);
    ASSERT_EQ(summary.metrics.size(), 1u);
    EXPECT_EQ(summary.metrics[0].throughput_req_per_sec, 0);
}
