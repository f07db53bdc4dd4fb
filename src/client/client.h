// client.h
#ifndef CLIENT_H
#define CLIENT_H

#include <chrono>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

#include <httplib.h>

#include "../common/request_t.h"
#include "endpoint_selector.h"

/* Sends one request and hands back whatever cpp-httplib produced. */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual httplib::Result send(const EndpointRoute& route, int timeout_ms) = 0;
};

class Client : public HttpTransport {
private:
    std::string base_url;

    static void apply_timeouts(httplib::Client& cli, int timeout_ms) {
        time_t sec = timeout_ms / 1000;
        time_t usec = static_cast<time_t>(timeout_ms % 1000) * 1000;
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);
        cli.set_write_timeout(sec, usec);
        // Caps the whole exchange; the limits above only apply per connect/recv/send.
        cli.set_max_timeout(std::chrono::milliseconds(timeout_ms));
    }

public:
    explicit Client(std::string base_url) : base_url(std::move(base_url)) {}

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // A fresh httplib::Client per request: concurrent requests never share a connection.
    httplib::Result send(const EndpointRoute& route, int timeout_ms) override {
        httplib::Client cli(base_url);
        apply_timeouts(cli, timeout_ms);
        cli.set_keep_alive(false);

        switch (route.method) {
            case request_t::POST:
                return cli.Post(route.path, route.body, route.content_type);
            case request_t::GET:
                return cli.Get(route.path);
        }
        throw std::invalid_argument("unsupported method " + request_t::to_string(route.method) +
                                    " for " + route.path);
    }

    /* Non-fatal preflight against GET /health. */
    bool check_health(int timeout_ms, std::string& error) {
        httplib::Client cli(base_url);
        apply_timeouts(cli, timeout_ms);
        auto res = cli.Get("/health");
        if (!res) {
            error = httplib::to_string(res.error());
            return false;
        }
        if (res->status < 200 || res->status >= 300) {
            error = "HTTP " + std::to_string(res->status);
            return false;
        }
        return true;
    }

    const std::string& get_base_url() const { return base_url; }
};

#endif // CLIENT_H
