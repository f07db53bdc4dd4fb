#ifndef AGGREGATOR_H
#define AGGREGATOR_H

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <string>
#include <vector>

#include "metrics.h"

inline double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

/* Nearest-rank pick from an ascending sample: index = ceil(p/100 * n) - 1, clamped into [0, n-1]. */
inline double nearest_rank(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    long long n = static_cast<long long>(sorted.size());
    long long idx = static_cast<long long>(std::ceil((p / 100.0) * n)) - 1;
    idx = std::max(0LL, std::min(idx, n - 1));
    return sorted[static_cast<size_t>(idx)];
}

/* Nearest-rank percentile of an unsorted sample. An empty sample yields 0. */
inline double percentile(std::vector<double> values, double p) {
    std::sort(values.begin(), values.end());
    return nearest_rank(values, p);
}

inline LatencyStats compute_latency_stats(std::vector<double> samples) {
    LatencyStats stats;
    if (samples.empty()) return stats;

    std::sort(samples.begin(), samples.end());
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);

    stats.min = samples.front();
    stats.max = samples.back();
    stats.avg = round2(sum / samples.size());
    stats.p50 = nearest_rank(samples, 50);
    stats.p90 = nearest_rank(samples, 90);
    stats.p99 = nearest_rank(samples, 99);
    return stats;
}

/* Successes per second over the given duration, 0 for an empty duration. */
inline double throughput(size_t successes, int64_t duration_ms) {
    if (duration_ms <= 0) return 0.0;
    return round2(successes / (duration_ms / 1000.0));
}

inline EndpointMetrics zero_metrics(const std::string& endpoint, int64_t run_duration_ms) {
    EndpointMetrics m;
    m.endpoint = endpoint;
    m.run_duration_ms = run_duration_ms;
    return m;
}

/*
 * Groups one run's outcomes per endpoint. Every endpoint of the pool is present
 * in the result (zero metrics when never hit); throughput of every endpoint is
 * measured against the whole run duration. Sorted by endpoint.
 */
inline std::vector<EndpointMetrics> aggregate(const std::vector<RequestOutcome>& outcomes,
                                              int64_t run_duration_ms,
                                              const std::vector<std::string>& pool) {
    std::map<std::string, std::vector<const RequestOutcome*>> groups;
    for (const auto& outcome : outcomes) {
        groups[outcome.endpoint].push_back(&outcome);
    }

    std::vector<EndpointMetrics> metrics;
    metrics.reserve(groups.size() + pool.size());

    for (const auto& [endpoint, group] : groups) {
        EndpointMetrics m = zero_metrics(endpoint, run_duration_ms);
        std::vector<double> latencies;
        latencies.reserve(group.size());

        for (const RequestOutcome* outcome : group) {
            if (outcome->success) m.successes++;
            latencies.push_back(static_cast<double>(outcome->latency_ms));
        }
        m.total_requests = group.size();
        m.failures = m.total_requests - m.successes;
        m.throughput_req_per_sec = throughput(m.successes, run_duration_ms);
        m.latency = compute_latency_stats(std::move(latencies));
        metrics.push_back(m);
    }

    for (const auto& endpoint : pool) {
        if (groups.find(endpoint) == groups.end()) {
            groups[endpoint];
            metrics.push_back(zero_metrics(endpoint, run_duration_ms));
        }
    }

    std::sort(metrics.begin(), metrics.end(),
              [](const EndpointMetrics& a, const EndpointMetrics& b) { return a.endpoint < b.endpoint; });
    return metrics;
}

/* Raw latency samples per endpoint, for callers that keep them across runs. */
inline std::map<std::string, std::vector<double>> collect_latency_samples(const std::vector<RequestOutcome>& outcomes) {
    std::map<std::string, std::vector<double>> samples;
    for (const auto& outcome : outcomes) {
        samples[outcome.endpoint].push_back(static_cast<double>(outcome.latency_ms));
    }
    return samples;
}

#endif // AGGREGATOR_H
