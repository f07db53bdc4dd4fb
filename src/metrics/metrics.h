#ifndef METRICS_H
#define METRICS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class ErrorKind {
    TIMEOUT,
    CONNECTION_ERROR,
    HTTP_ERROR,
    UNKNOWN_ERROR
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::CONNECTION_ERROR: return "ConnectionError";
        case ErrorKind::HTTP_ERROR: return "HTTPError";
        case ErrorKind::UNKNOWN_ERROR: return "UnknownError";
    }
    return "UnknownError";
}

struct RequestOutcome {
    std::string endpoint;
    bool success = false;
    std::optional<int> http_status;
    int64_t latency_ms = 0;
    std::optional<ErrorKind> error_kind;
    std::string error_msg;
};

struct LatencyStats {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double p99 = 0.0;
};

struct EndpointMetrics {
    std::string endpoint;
    size_t total_requests = 0;
    size_t successes = 0;
    size_t failures = 0;
    int64_t run_duration_ms = 0;
    double throughput_req_per_sec = 0.0;
    LatencyStats latency;
};

struct RunSummary {
    int run_index = 0;
    int64_t duration_ms = 0;
    std::vector<EndpointMetrics> metrics;
    // Raw latencies per endpoint, kept for the exact cross-run merge.
    std::map<std::string, std::vector<double>> latency_samples;
};

struct GlobalSummary {
    size_t runs = 0;
    int64_t duration_ms = 0;
    std::vector<EndpointMetrics> metrics;
};

#endif // METRICS_H
