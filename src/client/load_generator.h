#ifndef LOAD_GENERATOR_H
#define LOAD_GENERATOR_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "../common/run_config.h"
#include "../metrics/metrics.h"
#include "client.h"
#include "endpoint_selector.h"
#include "result_recorder.h"

struct DispatchResult {
    std::vector<RequestOutcome> outcomes;
    int64_t duration_ms = 0;
    std::vector<size_t> batch_sizes;
};

/*
 * Batched load generator. A batch holds at most `concurrency` requests, one
 * thread each, and the next batch only starts once every request of the
 * current one has settled. A slow request therefore holds back the whole next
 * batch.
 */
class LoadGenerator {
private:
    RunConfig config;
    HttpTransport& transport;
    const EndpointSelector& selector;

    std::vector<RequestOutcome> run_batch(const std::vector<EndpointRoute>& routes) {
        std::vector<RequestOutcome> batch_outcomes(routes.size());
        std::vector<std::thread> threads;
        threads.reserve(routes.size());

        size_t started = 0;
        try {
            for (; started < routes.size(); ++started) {
                // Each worker owns exactly one slot of batch_outcomes.
                threads.push_back(start_worker([this, &routes, &batch_outcomes, started]() {
                    ResultRecorder recorder(transport, config.timeout_ms);
                    batch_outcomes[started] = recorder.record(routes[started]);
                }));
            }
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher] Could not start worker " << started + 1 << "/" << routes.size()
                      << ": " << e.what() << std::endl;
            for (size_t i = started; i < routes.size(); ++i) {
                batch_outcomes[i].endpoint = routes[i].path;
                batch_outcomes[i].error_kind = ErrorKind::UNKNOWN_ERROR;
                batch_outcomes[i].error_msg = std::string("Exception: ") + e.what();
            }
        }

        for (auto& t : threads) {
            t.join();
        }
        return batch_outcomes;
    }

    DispatchResult dispatch(size_t total, const std::function<std::string()>& next_endpoint) {
        DispatchResult result;
        if (total == 0) return result;

        result.outcomes.reserve(total);
        const size_t limit = static_cast<size_t>(config.concurrency);
        size_t dispatched = 0;

        auto start = std::chrono::steady_clock::now();
        while (dispatched < total) {
            size_t batch_size = std::min(limit, total - dispatched);

            std::vector<EndpointRoute> routes;
            routes.reserve(batch_size);
            for (size_t i = 0; i < batch_size; ++i) {
                routes.push_back(selector.route_for(next_endpoint()));
            }

            std::vector<RequestOutcome> batch_outcomes = run_batch(routes);
            if (config.verbose) {
                for (const auto& outcome : batch_outcomes) {
                    if (outcome.success) continue;
                    std::cerr << "[Dispatcher] " << outcome.endpoint << " failed after "
                              << outcome.latency_ms << "ms: "
                              << error_kind_to_string(outcome.error_kind.value_or(ErrorKind::UNKNOWN_ERROR))
                              << " (" << outcome.error_msg << ")" << std::endl;
                }
            }
            result.outcomes.insert(result.outcomes.end(),
                                   std::make_move_iterator(batch_outcomes.begin()),
                                   std::make_move_iterator(batch_outcomes.end()));
            result.batch_sizes.push_back(batch_size);
            dispatched += batch_size;
        }
        auto end = std::chrono::steady_clock::now();

        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        return result;
    }

protected:
    /* Starts one request worker. Throws std::system_error when no thread can be created. */
    virtual std::thread start_worker(std::function<void()> work) {
        return std::thread(std::move(work));
    }

public:
    LoadGenerator(RunConfig config, HttpTransport& transport, const EndpointSelector& selector)
        : config(std::move(config)), transport(transport), selector(selector) {}

    virtual ~LoadGenerator() = default;

    /* Random mode: total_requests picks from the whole pool, with replacement. */
    DispatchResult run_random(std::mt19937& gen) {
        return dispatch(static_cast<size_t>(config.total_requests),
                        [this, &gen]() { return selector.pick_random(gen); });
    }

    /* Sequential mode: `requests` requests against a single endpoint. */
    DispatchResult run_endpoint(const std::string& endpoint, size_t requests) {
        return dispatch(requests, [&endpoint]() { return endpoint; });
    }
};

#endif // LOAD_GENERATOR_H
