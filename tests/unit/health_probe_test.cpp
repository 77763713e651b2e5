/**
 * @file health_probe_test.cpp
 * @brief HealthProbe classification over a mocked HTTP seam
 */

#include "backend/health_probe.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/mock_backend_http.hpp"

using namespace tether;
using namespace tether::backend;
using namespace tether::tests;
using namespace testing;

class HealthProbeTest : public Test {
protected:
    StrictMock<MockBackendHttp> http;
    BackendEndpoint endpoint;
};

TEST_F(HealthProbeTest, SuccessStatusIsHealthy) {
    EXPECT_CALL(http, get(_, std::string(kHealthPath), 750)).WillOnce(Return(http_status(200)));

    HealthProbe probe(http, 750);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::HEALTHY);
}

TEST_F(HealthProbeTest, Any2xxIsHealthy) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(http_status(204)));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::HEALTHY);
}

TEST_F(HealthProbeTest, ServiceUnavailableIsNotReady) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(http_status(503)));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::NOT_READY);
}

TEST_F(HealthProbeTest, RedirectAndClientErrorsAreNotReady) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(http_status(302))).WillOnce(Return(http_status(404)));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::NOT_READY);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::NOT_READY);
}

TEST_F(HealthProbeTest, ConnectionRefusedIsUnreachable) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(http_refused()));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::UNREACHABLE);
}

TEST_F(HealthProbeTest, TimeoutIsUnreachable) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(http_timed_out()));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::UNREACHABLE);
}

TEST_F(HealthProbeTest, OtherTransportFailureIsUnreachable) {
    EXPECT_CALL(http, get(_, _, _)).WillOnce(Return(HttpOutcome{}));

    HealthProbe probe(http, 1000);
    EXPECT_EQ(probe.probe(endpoint), ProbeResult::UNREACHABLE);
}

TEST(BackendEndpointTest, BuildsUrls) {
    BackendEndpoint endpoint;
    endpoint.host = "localhost";
    endpoint.port = 4123;

    EXPECT_EQ(endpoint.base_url(), "http://localhost:4123");
    EXPECT_EQ(endpoint.health_url(), "http://localhost:4123/api/health");
    EXPECT_EQ(endpoint.shutdown_url(), "http://localhost:4123/api/shutdown");
}
