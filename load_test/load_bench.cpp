/////////////////////////////////
// load_bench.cpp
#include <exception>
#include <iostream>
#include <string>

#include "../src/client/benchmark_runner.h"
#include "../src/client/client.h"
#include "../src/common/run_config.h"

int main(int argc, char* argv[]) {
    RunConfig config;
    try {
        config = parse_arguments(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        std::cerr << "Run '" << argv[0] << " --help' for the list of options." << std::endl;
        return 1;
    }

    if (config.show_help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    Client client(config.base_url);

    std::string health_error;
    if (!client.check_health(config.timeout_ms, health_error)) {
        std::cerr << "[Runner] Health check against " << config.base_url
                  << " failed (" << health_error << "), running anyway" << std::endl;
    }

    try {
        BenchmarkRunner runner(config, client);
        runner.run();
    } catch (const std::exception& e) {
        std::cerr << "[Runner] Aborted: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nBenchmark finished" << std::endl;
    return 0;
}
