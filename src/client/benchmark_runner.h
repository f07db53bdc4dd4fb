#ifndef BENCHMARK_RUNNER_H
#define BENCHMARK_RUNNER_H

#include <algorithm>
#include <iostream>
#include <random>
#include <vector>

#include "../common/run_config.h"
#include "../metrics/aggregator.h"
#include "../metrics/metrics.h"
#include "../metrics/run_merger.h"
#include "../report/reporter.h"
#include "client.h"
#include "endpoint_selector.h"
#include "load_generator.h"

class BenchmarkRunner {
private:
    RunConfig config;
    HttpTransport& transport;
    EndpointSelector selector;
    std::mt19937 gen;
    std::ostream& out;

    RunSummary run_random(int run_index, LoadGenerator& generator) {
        DispatchResult dispatch = generator.run_random(gen);

        RunSummary run;
        run.run_index = run_index;
        run.duration_ms = dispatch.duration_ms;
        run.metrics = aggregate(dispatch.outcomes, dispatch.duration_ms, selector.pool());
        run.latency_samples = collect_latency_samples(dispatch.outcomes);
        return run;
    }

    /* One concurrency-sized batch per endpoint, each endpoint timed on its own. */
    RunSummary run_sequential(int run_index, LoadGenerator& generator) {
        RunSummary run;
        run.run_index = run_index;

        for (const auto& endpoint : selector.pool()) {
            if (std::any_of(run.metrics.begin(), run.metrics.end(),
                            [&endpoint](const EndpointMetrics& m) { return m.endpoint == endpoint; })) {
                continue;
            }

            out << "Benchmarking " << endpoint << " ... " << std::flush;
            DispatchResult dispatch = generator.run_endpoint(endpoint, static_cast<size_t>(config.concurrency));
            out << "done" << std::endl;

            std::vector<EndpointMetrics> single = aggregate(dispatch.outcomes, dispatch.duration_ms, {endpoint});
            run.metrics.insert(run.metrics.end(), single.begin(), single.end());
            run.duration_ms += dispatch.duration_ms;

            auto samples = collect_latency_samples(dispatch.outcomes);
            run.latency_samples[endpoint] = std::move(samples[endpoint]);
        }

        std::sort(run.metrics.begin(), run.metrics.end(),
                  [](const EndpointMetrics& a, const EndpointMetrics& b) { return a.endpoint < b.endpoint; });
        return run;
    }

public:
    BenchmarkRunner(RunConfig config, HttpTransport& transport, std::ostream& out = std::cout)
        : config(config), transport(transport), selector(config.endpoints), out(out) {
        if (config.seed) {
            gen.seed(*config.seed);
        } else {
            gen.seed(std::random_device{}());
        }
    }

    EndpointSelector& get_selector() { return selector; }

    RunSummary run_once(int run_index) {
        LoadGenerator generator(config, transport, selector);
        if (config.mode == DispatchMode::SEQUENTIAL) {
            return run_sequential(run_index, generator);
        }
        return run_random(run_index, generator);
    }

    GlobalSummary run() {
        print_report_header(out, config);

        std::vector<RunSummary> runs;
        runs.reserve(config.repeat);

        for (int r = 1; r <= config.repeat; ++r) {
            print_run_header(out, r, config.repeat);
            RunSummary run = run_once(r);
            print_metrics(out, run.metrics);
            out << "Run time: " << run.duration_ms << "ms\n" << std::endl;
            runs.push_back(std::move(run));
        }

        GlobalSummary summary = merge_runs(runs, config.latency_merge);
        print_global_summary(out, summary, config.latency_merge);
        return summary;
    }
};

#endif // BENCHMARK_RUNNER_H
