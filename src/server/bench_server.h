#ifndef BENCH_SERVER_H
#define BENCH_SERVER_H

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "account.h"

struct ServerOptions {
    double delay_scale = 1.0;          // multiplies every simulated delay and the request budget
    double request_budget_ms = 2000;   // past this a request answers 503
    size_t worker_threads = 64;
    long long initial_balance = 1000;
};

inline long long factorial_value(int n) {
    long long result = 1;
    for (int i = 2; i <= n; ++i) result *= i;
    return result;
}

inline long long fibonacci_value(int n) {
    long long a = 0, b = 1;
    for (int i = 0; i < n; ++i) {
        long long next = a + b;
        a = b;
        b = next;
    }
    return a;
}

/* Recursive calls of the naive Fibonacci that pay the simulated 200ms (those with n > 1). */
inline long long fibonacci_delay_steps(int n) {
    if (n <= 1) return 0;
    long long prev = 0, current = 0;  // steps(0), steps(1)
    for (int i = 2; i <= n; ++i) {
        long long next = 1 + current + prev;
        prev = current;
        current = next;
    }
    return current;
}

inline std::optional<int> parse_path_int(const std::string& text) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/* Positive integer "amount" from a JSON body. */
inline std::optional<long long> parse_amount(const std::string& body) {
    nlohmann::json payload = nlohmann::json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object() || !payload.contains("amount")) return std::nullopt;

    const auto& amount = payload["amount"];
    if (!amount.is_number_integer()) return std::nullopt;
    long long value = amount.get<long long>();
    if (value <= 0) return std::nullopt;
    return value;
}

/*
 * Demo system under test. Endpoints simulate slow work with sleeps, share a
 * counter and an account balance, and give up with 503 once a request has
 * used its processing budget.
 */
class BenchServer {
private:
    ServerOptions options;
    httplib::Server svr;
    Account account;

    std::atomic<long long> shared_counter{0};
    std::atomic<uint64_t> total_requests{0};
    std::atomic<uint64_t> failed_requests{0};
    std::atomic<uint64_t> budget_overruns{0};

    void sleep_scaled(double ms) {
        auto scaled = std::chrono::duration<double, std::milli>(ms * options.delay_scale);
        std::this_thread::sleep_for(scaled);
    }

    /*
     * Waits out a simulated delay. When the delay does not fit the request
     * budget the budget is waited out instead and false is returned.
     */
    bool simulate_latency(double delay_ms) {
        if (delay_ms > options.request_budget_ms) {
            sleep_scaled(options.request_budget_ms);
            budget_overruns++;
            return false;
        }
        sleep_scaled(delay_ms);
        return true;
    }

    static void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    static void send_unavailable(httplib::Response& res) {
        res.status = 503;
        res.set_content("Service unavailable. Please retry.", "text/plain");
    }

    double heavy_computation(int n) {
        long long iterations = static_cast<long long>(n * 1e6 * options.delay_scale);
        if (iterations < 1) iterations = 1;
        double result = 0;
        for (long long i = 0; i < iterations; ++i) {
            result += std::sqrt(static_cast<double>(i % 1000));
        }
        return result;
    }

    void register_routes() {
        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"status", "ok"}});
        });

        svr.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
            std::stringstream ss;
            ss << "Server Statistics:\n";
            ss << "Total Requests: " << total_requests.load() << "\n";
            ss << "Failed Requests: " << failed_requests.load() << "\n";
            ss << "Budget Overruns: " << budget_overruns.load() << "\n";
            ss << "Counter: " << shared_counter.load() << "\n";
            ss << "Balance: " << account.get_balance() << "\n";
            res.set_content(ss.str(), "text/plain");
        });

        svr.Get("/compute", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"result", heavy_computation(10)}});
        });

        svr.Get("/counter", [this](const httplib::Request&, httplib::Response& res) {
            if (!simulate_latency(5000)) {
                send_unavailable(res);
                return;
            }
            send_json(res, {{"counter", ++shared_counter}});
        });

        svr.Get("/slow", [this](const httplib::Request&, httplib::Response& res) {
            if (!simulate_latency(20000)) {
                send_unavailable(res);
                return;
            }
            res.status = 200;
        });

        svr.Get("/factorial/:n", [this](const httplib::Request& req, httplib::Response& res) {
            auto n = parse_path_int(req.path_params.at("n"));
            if (!n || *n < 0 || *n > 15) {
                send_json(res, {{"error", "invalid parameter (0 <= n <= 15)"}}, 400);
                return;
            }
            // one simulated 200ms step per multiplication
            double delay = *n > 1 ? 200.0 * (*n - 1) : 0.0;
            if (!simulate_latency(delay)) {
                send_unavailable(res);
                return;
            }
            send_json(res, {{"n", *n}, {"factorial", factorial_value(*n)}});
        });

        svr.Get("/fibonacci/:n", [this](const httplib::Request& req, httplib::Response& res) {
            auto n = parse_path_int(req.path_params.at("n"));
            if (!n || *n < 0 || *n > 25) {
                send_json(res, {{"error", "invalid parameter (0 <= n <= 25)"}}, 400);
                return;
            }
            if (!simulate_latency(200.0 * fibonacci_delay_steps(*n))) {
                send_unavailable(res);
                return;
            }
            send_json(res, {{"n", *n}, {"fibonacci", fibonacci_value(*n)}});
        });

        svr.Post("/deposit", [this](const httplib::Request& req, httplib::Response& res) {
            auto amount = parse_amount(req.body);
            if (!amount) {
                send_json(res, {{"error", "invalid amount"}}, 400);
                return;
            }
            if (!simulate_latency(500)) {
                send_unavailable(res);
                return;
            }
            send_json(res, {{"balance", account.deposit(*amount)}});
        });

        svr.Post("/withdraw", [this](const httplib::Request& req, httplib::Response& res) {
            auto amount = parse_amount(req.body);
            if (!amount) {
                send_json(res, {{"error", "invalid amount"}}, 400);
                return;
            }
            if (!simulate_latency(200)) {
                send_unavailable(res);
                return;
            }
            auto balance = account.withdraw(*amount);
            if (!balance) {
                send_json(res, {{"error", "insufficient funds"}}, 400);
                return;
            }
            send_json(res, {{"balance", *balance}});
        });

        svr.Get("/account", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"balance", account.get_balance()}});
        });

        svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
            std::cerr << "[Server] " << req.method << " " << req.path << " failed: " << what << std::endl;
            res.status = 500;
            res.set_content("Internal server error", "text/plain");
        });

        svr.set_logger([this](const httplib::Request&, const httplib::Response& res) {
            total_requests++;
            if (res.status >= 400) failed_requests++;
        });
    }

public:
    explicit BenchServer(ServerOptions options = ServerOptions())
        : options(options), account(options.initial_balance) {
        size_t workers = options.worker_threads;
        svr.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
        register_routes();
    }

    ~BenchServer() {
        stop();
    }

    BenchServer(const BenchServer&) = delete;
    BenchServer& operator=(const BenchServer&) = delete;

    /* Blocks until stop() is called. */
    bool listen(const std::string& host, int port) {
        std::cout << "\n=== Bench Server Configuration ===" << std::endl;
        std::cout << "Address: http://" << host << ":" << port << std::endl;
        std::cout << "Delay Scale: " << options.delay_scale << std::endl;
        std::cout << "Request Budget: " << options.request_budget_ms << "ms" << std::endl;
        std::cout << "Worker Threads: " << options.worker_threads << std::endl;
        std::cout << "Endpoints: /compute, /counter, /slow, /factorial/:n, /fibonacci/:n, "
                  << "/deposit, /withdraw, /account, /health, /stats" << std::endl;
        std::cout << "==================================\n" << std::endl;
        return svr.listen(host, port);
    }

    int bind_to_any_port(const std::string& host) { return svr.bind_to_any_port(host); }
    bool listen_after_bind() { return svr.listen_after_bind(); }
    bool is_running() const { return svr.is_running(); }

    void stop() {
        if (svr.is_running()) svr.stop();
    }

    long long get_balance() const { return account.get_balance(); }
    long long get_counter() const { return shared_counter.load(); }
    uint64_t get_total_requests() const { return total_requests.load(); }
    uint64_t get_failed_requests() const { return failed_requests.load(); }
};

#endif // BENCH_SERVER_H
