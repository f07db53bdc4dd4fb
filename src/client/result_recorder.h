#ifndef RESULT_RECORDER_H
#define RESULT_RECORDER_H

#include <chrono>
#include <exception>
#include <string>

#include <httplib.h>

#include "../metrics/metrics.h"
#include "client.h"
#include "endpoint_selector.h"

/*
 * Turns whatever a request produced into a RequestOutcome.
 * Order matters: a request that outlived its timeout is a Timeout even if a
 * response eventually showed up.
 */
inline RequestOutcome classify(const std::string& endpoint, const httplib::Result& res,
                               int64_t elapsed_ms, int timeout_ms) {
    RequestOutcome outcome;
    outcome.endpoint = endpoint;
    outcome.latency_ms = elapsed_ms;

    if (elapsed_ms >= timeout_ms) {
        outcome.error_kind = ErrorKind::TIMEOUT;
        outcome.error_msg = "timeout of " + std::to_string(timeout_ms) + "ms exceeded";
        return outcome;
    }

    if (!res) {
        httplib::Error err = res.error();
        outcome.error_kind = (err == httplib::Error::Unknown) ? ErrorKind::UNKNOWN_ERROR : ErrorKind::CONNECTION_ERROR;
        outcome.error_msg = httplib::to_string(err);
        return outcome;
    }

    outcome.http_status = res->status;
    if (res->status >= 200 && res->status < 300) {
        outcome.success = true;
        return outcome;
    }

    outcome.error_kind = ErrorKind::HTTP_ERROR;
    outcome.error_msg = "HTTP " + std::to_string(res->status);
    return outcome;
}

class ResultRecorder {
private:
    HttpTransport& transport;
    int timeout_ms;

public:
    ResultRecorder(HttpTransport& transport, int timeout_ms)
        : transport(transport), timeout_ms(timeout_ms) {}

    /* Never throws: transport exceptions become UnknownError outcomes. */
    RequestOutcome record(const EndpointRoute& route) {
        auto start = std::chrono::steady_clock::now();
        try {
            httplib::Result res = transport.send(route, timeout_ms);
            auto end = std::chrono::steady_clock::now();
            int64_t latency = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
            return classify(route.path, res, latency, timeout_ms);
        } catch (const std::exception& e) {
            auto end = std::chrono::steady_clock::now();
            RequestOutcome outcome;
            outcome.endpoint = route.path;
            outcome.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
            outcome.error_kind = ErrorKind::UNKNOWN_ERROR;
            outcome.error_msg = std::string("Exception: ") + e.what();
            return outcome;
        }
    }

    int get_timeout_ms() const { return timeout_ms; }
};

#endif // RESULT_RECORDER_H
