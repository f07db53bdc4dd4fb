#ifndef ENDPOINT_SELECTOR_H
#define ENDPOINT_SELECTOR_H

#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../common/request_t.h"

/* What actually goes on the wire for one endpoint. */
struct EndpointRoute {
    std::string path;
    request_t::request_t method = request_t::GET;
    std::string body;
    std::string content_type;
};

inline const std::string& mutating_payload() {
    static const std::string payload = nlohmann::json{{"amount", 1}}.dump();
    return payload;
}

/*
 * Holds the endpoint pool and the method table. Endpoints without an entry in
 * the table are plain GETs; POST entries carry the fixed JSON payload.
 */
class EndpointSelector {
private:
    std::vector<std::string> endpoints;
    std::map<std::string, request_t::request_t> method_table;

public:
    explicit EndpointSelector(std::vector<std::string> pool) : endpoints(std::move(pool)) {
        if (endpoints.empty()) {
            throw std::invalid_argument("endpoint pool must not be empty");
        }
        register_method("/deposit", request_t::POST);
        register_method("/withdraw", request_t::POST);
    }

    void register_method(const std::string& endpoint, request_t::request_t method) {
        method_table[endpoint] = method;
    }

    request_t::request_t method_for(const std::string& endpoint) const {
        auto it = method_table.find(endpoint);
        return it == method_table.end() ? request_t::GET : it->second;
    }

    EndpointRoute route_for(const std::string& endpoint) const {
        EndpointRoute route;
        route.path = endpoint;
        route.method = method_for(endpoint);
        if (route.method == request_t::POST) {
            route.body = mutating_payload();
            route.content_type = "application/json";
        }
        return route;
    }

    // Uniform pick with replacement.
    const std::string& pick_random(std::mt19937& gen) const {
        std::uniform_int_distribution<size_t> dis(0, endpoints.size() - 1);
        return endpoints[dis(gen)];
    }

    const std::vector<std::string>& pool() const { return endpoints; }
};

#endif // ENDPOINT_SELECTOR_H
