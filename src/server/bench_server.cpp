#include <exception>
#include <iostream>
#include <string>

#include "bench_server.h"

int main(int argc, char* argv[]) {
    // Usage: bench_server [port] [delay_scale] [threads]
    int port = 3000;
    ServerOptions options;
    try {
        if (argc >= 2) port = std::stoi(argv[1]);
        if (argc >= 3) options.delay_scale = std::stod(argv[2]);
        if (argc >= 4) options.worker_threads = static_cast<size_t>(std::stoul(argv[3]));
    } catch (const std::exception&) {
        std::cerr << "Usage: " << argv[0] << " [port=3000] [delay_scale=1.0] [threads=64]" << std::endl;
        return 1;
    }
    if (port <= 0 || port > 65535 || options.delay_scale < 0 || options.worker_threads == 0) {
        std::cerr << "Usage: " << argv[0] << " [port=3000] [delay_scale=1.0] [threads=64]" << std::endl;
        return 1;
    }

    BenchServer server(options);
    if (!server.listen("0.0.0.0", port)) {
        std::cerr << "[Server] Failed to listen on port " << port << std::endl;
        return 1;
    }
    return 0;
}
