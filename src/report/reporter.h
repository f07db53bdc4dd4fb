#ifndef REPORTER_H
#define REPORTER_H

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "../common/run_config.h"
#include "../metrics/metrics.h"

/* At most two decimals, trailing zeros dropped: 5 -> "5", 12.50 -> "12.5". */
inline std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    std::string s = ss.str();
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

inline std::string pad(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

inline std::string format_metrics_row(const EndpointMetrics& m) {
    return pad(m.endpoint, 20) +
           pad(std::to_string(m.total_requests), 8) +
           pad(std::to_string(m.successes), 8) +
           pad(std::to_string(m.failures), 8) +
           pad(std::to_string(m.run_duration_ms) + "ms", 12) +
           pad(format_number(m.throughput_req_per_sec) + "/s", 12) +
           pad("avg:" + format_number(m.latency.avg) + "ms", 12) +
           pad("p90:" + format_number(m.latency.p90) + "ms", 12) +
           pad("p99:" + format_number(m.latency.p99) + "ms", 12);
}

inline void print_report_header(std::ostream& out, const RunConfig& config) {
    out << "\n=== Benchmark report ===" << std::endl;
    out << "Target: " << config.base_url << std::endl;
    out << "Concurrency: " << config.concurrency
        << ", Timeout: " << config.timeout_ms << "ms"
        << ", Repeat: " << config.repeat << std::endl;
    out << "Mode: " << mode_to_string(config.mode);
    if (config.mode == DispatchMode::RANDOM) {
        out << ", Requests per run: " << config.total_requests;
    }
    out << ", Latency merge: " << merge_policy_to_string(config.latency_merge) << std::endl;

    out << "Endpoints: ";
    for (size_t i = 0; i < config.endpoints.size(); ++i) {
        if (i > 0) out << ", ";
        out << config.endpoints[i];
    }
    out << std::endl;
    out << "========================\n" << std::endl;
}

inline void print_run_header(std::ostream& out, int run_index, int repeat) {
    out << "--- Run " << run_index << "/" << repeat << " ---" << std::endl;
}

inline void print_column_header(std::ostream& out) {
    out << "endpoint            total   succ    fail    time(ms)    thr/s       avgLat(ms)  p90(ms)     p99(ms)" << std::endl;
}

inline void print_metrics(std::ostream& out, const std::vector<EndpointMetrics>& metrics) {
    for (const auto& m : metrics) {
        out << format_metrics_row(m) << std::endl;
    }
}

inline void print_global_summary(std::ostream& out, const GlobalSummary& summary, LatencyMergePolicy policy) {
    out << "\n=== Final summary ===" << std::endl;
    out << "Runs: " << summary.runs << ", Total time: " << summary.duration_ms << "ms";
    if (policy == LatencyMergePolicy::REPEAT_AVERAGE && summary.runs > 1) {
        out << " (latency columns rebuilt from per-run averages)";
    }
    out << std::endl;
    print_column_header(out);
    print_metrics(out, summary.metrics);
}

#endif // REPORTER_H
