#ifndef RUN_CONFIG_H
#define RUN_CONFIG_H

#include <cstdlib>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/* Thrown for every invalid or inconsistent run parameter. Fatal: nothing is dispatched. */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class DispatchMode {
    RANDOM,
    SEQUENTIAL
};

enum class LatencyMergePolicy {
    REPEAT_AVERAGE,
    RETAINED_SAMPLES
};

inline std::vector<std::string> default_endpoints() {
    return {
        "/compute",
        "/counter",
        "/slow",
        "/factorial/10",
        "/fibonacci/10",
        "/deposit",
        "/withdraw",
        "/account"
    };
}

struct RunConfig {
    std::string base_url = "http://localhost:3000";
    int concurrency = 10;
    int timeout_ms = 5000;
    int total_requests = 100;
    int repeat = 1;
    std::vector<std::string> endpoints = default_endpoints();
    DispatchMode mode = DispatchMode::RANDOM;
    std::optional<unsigned int> seed;
    LatencyMergePolicy latency_merge = LatencyMergePolicy::REPEAT_AVERAGE;
    bool verbose = false;
    bool show_help = false;
};

inline std::string mode_to_string(DispatchMode mode) {
    return mode == DispatchMode::SEQUENTIAL ? "sequential" : "random";
}

inline std::string merge_policy_to_string(LatencyMergePolicy policy) {
    return policy == LatencyMergePolicy::RETAINED_SAMPLES ? "exact" : "average";
}

/* Splits a comma separated endpoint list, trimming blanks and dropping empty entries. */
inline std::vector<std::string> split_endpoints(const std::string& list) {
    std::vector<std::string> endpoints;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        size_t last = item.find_last_not_of(" \t");
        endpoints.push_back(item.substr(first, last - first + 1));
    }
    return endpoints;
}

inline long long parse_number(const std::string& option, const std::string& text) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) {
            throw ConfigError("invalid value for " + option + ": '" + text + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigError("invalid value for " + option + ": '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError("value out of range for " + option + ": '" + text + "'");
    }
}

inline int parse_int(const std::string& option, const std::string& text) {
    long long value = parse_number(option, text);
    if (value < -2147483647LL || value > 2147483647LL) {
        throw ConfigError("value out of range for " + option + ": '" + text + "'");
    }
    return static_cast<int>(value);
}

inline void validate(const RunConfig& config) {
    if (config.concurrency <= 0) {
        throw ConfigError("concurrency must be positive (got " + std::to_string(config.concurrency) + ")");
    }
    if (config.timeout_ms <= 0) {
        throw ConfigError("timeout must be positive (got " + std::to_string(config.timeout_ms) + ")");
    }
    if (config.total_requests < 0) {
        throw ConfigError("request count must not be negative (got " + std::to_string(config.total_requests) + ")");
    }
    if (config.repeat <= 0) {
        throw ConfigError("repeat must be positive (got " + std::to_string(config.repeat) + ")");
    }
    if (config.endpoints.empty()) {
        throw ConfigError("endpoint pool is empty");
    }
    if (config.base_url.empty()) {
        throw ConfigError("target URL is empty");
    }
}

/*
 * Resolves a RunConfig from the command line. Accepts "--flag value" and
 * "--flag=value" for every option. LOAD_BENCH_URL overrides the default
 * target when --url is absent. The result is validated unless --help was given.
 */
inline RunConfig parse_arguments(int argc, char* argv[]) {
    RunConfig config;
    if (const char* env_url = std::getenv("LOAD_BENCH_URL")) {
        if (env_url[0] != '\0') config.base_url = env_url;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = arg;
        std::optional<std::string> inline_value;

        size_t eq = arg.find('=');
        if (arg.rfind("-", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        if (name == "-h" || name == "--help") {
            config.show_help = true;
            continue;
        }
        if (name == "-v" || name == "--verbose") {
            config.verbose = true;
            continue;
        }

        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= argc) throw ConfigError("missing value for " + name);
            return argv[++i];
        };

        if (name == "-c" || name == "--concurrency") {
            config.concurrency = parse_int(name, value());
        } else if (name == "-t" || name == "--timeout") {
            config.timeout_ms = parse_int(name, value());
        } else if (name == "-n" || name == "--requests") {
            config.total_requests = parse_int(name, value());
        } else if (name == "-r" || name == "--repeat") {
            config.repeat = parse_int(name, value());
        } else if (name == "-e" || name == "--endpoints") {
            config.endpoints = split_endpoints(value());
        } else if (name == "-u" || name == "--url") {
            config.base_url = value();
        } else if (name == "-m" || name == "--mode") {
            std::string mode = value();
            if (mode == "random") {
                config.mode = DispatchMode::RANDOM;
            } else if (mode == "sequential") {
                config.mode = DispatchMode::SEQUENTIAL;
            } else {
                throw ConfigError("unknown mode '" + mode + "' (expected random or sequential)");
            }
        } else if (name == "-s" || name == "--seed") {
            long long seed = parse_number(name, value());
            if (seed < 0 || seed > 4294967295LL) {
                throw ConfigError("seed out of range: " + std::to_string(seed));
            }
            config.seed = static_cast<unsigned int>(seed);
        } else if (name == "--latency-merge") {
            std::string policy = value();
            if (policy == "average") {
                config.latency_merge = LatencyMergePolicy::REPEAT_AVERAGE;
            } else if (policy == "exact") {
                config.latency_merge = LatencyMergePolicy::RETAINED_SAMPLES;
            } else {
                throw ConfigError("unknown latency merge policy '" + policy + "' (expected average or exact)");
            }
        } else {
            throw ConfigError("unknown option '" + arg + "'");
        }
    }

    if (!config.show_help) validate(config);
    return config;
}

inline void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options]\n"
        << "  -c, --concurrency <n>      max outstanding requests per batch (default 10)\n"
        << "  -t, --timeout <ms>         per-request timeout in ms (default 5000)\n"
        << "  -n, --requests <n>         requests per run, random mode (default 100)\n"
        << "  -r, --repeat <n>           number of runs to merge (default 1)\n"
        << "  -e, --endpoints <a,b,...>  endpoint pool (default: built-in demo pool)\n"
        << "  -u, --url <base>           target base URL (default $LOAD_BENCH_URL or http://localhost:3000)\n"
        << "  -m, --mode <random|sequential>\n"
        << "  -s, --seed <n>             seed for random endpoint selection\n"
        << "      --latency-merge <average|exact>\n"
        << "  -v, --verbose              log every failed request\n"
        << "  -h, --help\n"
        << "Example: " << program << " -c 20 -n 500 -r 3 -e /account,/deposit\n";
}

#endif // RUN_CONFIG_H
