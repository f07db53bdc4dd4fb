#ifndef RUN_MERGER_H
#define RUN_MERGER_H

#include <map>
#include <string>
#include <vector>

#include "../common/run_config.h"
#include "aggregator.h"
#include "metrics.h"

/*
 * Combines the per-run summaries into one row per endpoint.
 *
 * Counts and durations are summed; throughput is recomputed over the summed
 * duration. Latency depends on the policy:
 *  - REPEAT_AVERAGE: each run contributes its average latency repeated
 *    total_requests times. Min/max/percentiles are therefore approximations.
 *  - RETAINED_SAMPLES: the raw samples kept in every RunSummary are
 *    concatenated and the statistics are exact.
 */
inline GlobalSummary merge_runs(const std::vector<RunSummary>& runs,
                                LatencyMergePolicy policy = LatencyMergePolicy::REPEAT_AVERAGE) {
    struct Accumulator {
        EndpointMetrics totals;
        std::vector<double> samples;
    };

    GlobalSummary summary;
    summary.runs = runs.size();

    std::map<std::string, Accumulator> per_endpoint;

    for (const auto& run : runs) {
        summary.duration_ms += run.duration_ms;

        for (const auto& m : run.metrics) {
            Accumulator& acc = per_endpoint[m.endpoint];
            acc.totals.endpoint = m.endpoint;
            acc.totals.total_requests += m.total_requests;
            acc.totals.successes += m.successes;
            acc.totals.failures += m.failures;
            acc.totals.run_duration_ms += m.run_duration_ms;

            if (policy == LatencyMergePolicy::REPEAT_AVERAGE) {
                acc.samples.insert(acc.samples.end(), m.total_requests, m.latency.avg);
            } else {
                auto it = run.latency_samples.find(m.endpoint);
                if (it != run.latency_samples.end()) {
                    acc.samples.insert(acc.samples.end(), it->second.begin(), it->second.end());
                }
            }
        }
    }

    for (auto& [endpoint, acc] : per_endpoint) {
        EndpointMetrics m = acc.totals;
        m.throughput_req_per_sec = throughput(m.successes, m.run_duration_ms);
        m.latency = compute_latency_stats(std::move(acc.samples));
        summary.metrics.push_back(m);
    }
    return summary;
}

#endif // RUN_MERGER_H
