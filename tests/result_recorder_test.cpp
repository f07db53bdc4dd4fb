#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "client/result_recorder.h"
#include "fake_transport.h"

using namespace std::chrono_literals;

namespace {

EndpointRoute get_route(const std::string& path) {
    EndpointRoute route;
    route.path = path;
    return route;
}

}  // namespace

TEST(ClassifyTest, TwoHundredsAreSuccesses) {
    for (int status : {200, 201, 204, 299}) {
        RequestOutcome o = classify("/a", make_response(status), 12, 1000);
        EXPECT_TRUE(o.success) << status;
        ASSERT_TRUE(o.http_status.has_value());
        EXPECT_EQ(*o.http_status, status);
        EXPECT_FALSE(o.error_kind.has_value());
        EXPECT_EQ(o.latency_ms, 12);
        EXPECT_EQ(o.endpoint, "/a");
    }
}

TEST(ClassifyTest, OtherStatusesAreHttpErrors) {
    for (int status : {301, 400, 404, 500, 503}) {
        RequestOutcome o = classify("/a", make_response(status), 3, 1000);
        EXPECT_FALSE(o.success);
        ASSERT_TRUE(o.error_kind.has_value());
        EXPECT_EQ(*o.error_kind, ErrorKind::HTTP_ERROR);
        ASSERT_TRUE(o.http_status.has_value());
        EXPECT_EQ(*o.http_status, status);
        EXPECT_EQ(o.error_msg, "HTTP " + std::to_string(status));
    }
}

TEST(ClassifyTest, TransportFailureIsConnectionError) {
    RequestOutcome o = classify("/a", make_failure(httplib::Error::Connection), 1, 1000);
    EXPECT_FALSE(o.success);
    EXPECT_FALSE(o.http_status.has_value());
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, ErrorKind::CONNECTION_ERROR);
    EXPECT_FALSE(o.error_msg.empty());

    o = classify("/a", make_failure(httplib::Error::Read), 1, 1000);
    EXPECT_EQ(*o.error_kind, ErrorKind::CONNECTION_ERROR);
}

TEST(ClassifyTest, UnknownTransportErrorIsUnknownError) {
    RequestOutcome o = classify("/a", make_failure(httplib::Error::Unknown), 1, 1000);
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, ErrorKind::UNKNOWN_ERROR);
}

TEST(ClassifyTest, ElapsedTimeoutWinsOverLateResponse) {
    RequestOutcome o = classify("/a", make_response(200), 1000, 1000);
    EXPECT_FALSE(o.success);
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(o.latency_ms, 1000);

    o = classify("/a", make_failure(httplib::Error::Read), 1500, 1000);
    EXPECT_EQ(*o.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(o.latency_ms, 1500);
}

TEST(ResultRecorderTest, RecordsSuccessfulRequest) {
    FakeTransport transport;
    ResultRecorder recorder(transport, 1000);

    RequestOutcome o = recorder.record(get_route("/account"));
    EXPECT_TRUE(o.success);
    EXPECT_EQ(o.endpoint, "/account");
    EXPECT_EQ(*o.http_status, 200);
    EXPECT_GE(o.latency_ms, 0);
}

TEST(ResultRecorderTest, SlowRequestBecomesTimeout) {
    FakeTransport transport([](const EndpointRoute&) { return make_response(200); }, 60ms);
    ResultRecorder recorder(transport, 20);

    RequestOutcome o = recorder.record(get_route("/slow"));
    EXPECT_FALSE(o.success);
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, ErrorKind::TIMEOUT);
    EXPECT_GE(o.latency_ms, 20);
}

TEST(ResultRecorderTest, ThrowingTransportBecomesUnknownError) {
    FakeTransport transport([](const EndpointRoute&) -> httplib::Result {
        throw std::runtime_error("socket exploded");
    });
    ResultRecorder recorder(transport, 1000);

    RequestOutcome o = recorder.record(get_route("/a"));
    EXPECT_FALSE(o.success);
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, ErrorKind::UNKNOWN_ERROR);
    EXPECT_EQ(o.error_msg, "Exception: socket exploded");
    EXPECT_FALSE(o.http_status.has_value());
}

TEST(ResultRecorderTest, RouteIsForwardedUnchanged) {
    FakeTransport transport;
    ResultRecorder recorder(transport, 1000);

    EndpointRoute route;
    route.path = "/deposit";
    route.method = request_t::POST;
    route.body = "{\"amount\":1}";
    route.content_type = "application/json";
    recorder.record(route);

    auto seen = transport.routes();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].path, "/deposit");
    EXPECT_EQ(seen[0].method, request_t::POST);
    EXPECT_EQ(seen[0].body, "{\"amount\":1}");
}
