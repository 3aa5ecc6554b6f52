#include <gtest/gtest.h>

#include "FakeDevice.hpp"
#include "discovery/ProbeClient.hpp"

using namespace fleet_ops::discovery;
using fleet_ops::fakes::FakeDevice;

namespace
{
    constexpr std::chrono::milliseconds SHORT_TIMEOUT{300};
}

TEST(ProbeClientTest, HealthyDeviceReturnsBody)
{
    FakeDevice device;
    device.SetJson(200, R"({"device_id":"pi-01","device_name":"Kitchen","battery":72})");

    ProbeResult result = Probe("127.0.0.1", device.Port(), std::chrono::seconds(2));

    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.http_status, 200);
    EXPECT_EQ(result.body["device_id"], "pi-01");
    EXPECT_EQ(result.body["battery"], 72);

    auto requests = device.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "GET /api/health HTTP/1.1");
}

TEST(ProbeClientTest, ChunkedBodyIsAccepted)
{
    FakeDevice device;
    device.SetRaw("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                  "b\r\n{\"ok\":true}\r\n0\r\n\r\n");

    ProbeResult result = Probe("127.0.0.1", device.Port(), std::chrono::seconds(2));
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.body["ok"], true);
}

TEST(ProbeClientTest, ServerErrorIsBadStatus)
{
    FakeDevice device;
    device.SetJson(500, R"({"error":"camera busy"})");

    ProbeResult result = Probe("127.0.0.1", device.Port(), std::chrono::seconds(2));
    EXPECT_EQ(result.error, ProbeError::BadStatus);
    EXPECT_EQ(result.http_status, 500);
}

TEST(ProbeClientTest, NonJsonBodyIsMalformed)
{
    FakeDevice device;
    device.SetRaw("HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\nnot json!");

    EXPECT_EQ(Probe("127.0.0.1", device.Port(), std::chrono::seconds(2)).error, ProbeError::Malformed);
}

TEST(ProbeClientTest, ScalarJsonIsMalformed)
{
    FakeDevice device;
    device.SetJson(200, "42");

    EXPECT_EQ(Probe("127.0.0.1", device.Port(), std::chrono::seconds(2)).error, ProbeError::Malformed);
}

TEST(ProbeClientTest, NonHttpReplyIsMalformed)
{
    FakeDevice device;
    device.SetRaw("SSH-2.0-OpenSSH_9.6\r\n\r\n");

    EXPECT_EQ(Probe("127.0.0.1", device.Port(), std::chrono::seconds(2)).error, ProbeError::Malformed);
}

TEST(ProbeClientTest, SilentDeviceTimesOut)
{
    FakeDevice device;
    device.SetSilent();

    auto started = std::chrono::steady_clock::now();
    ProbeResult result = Probe("127.0.0.1", device.Port(), SHORT_TIMEOUT);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.error, ProbeError::Timeout);
    EXPECT_GE(elapsed, SHORT_TIMEOUT - std::chrono::milliseconds(20));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(ProbeClientTest, PartialBodyAtDeadlineTimesOut)
{
    FakeDevice device;
    device.SetStalled("HTTP/1.1 200 OK\r\nContent-Length: 64\r\n\r\n{\"device_id\":\"pi-01\"");

    ProbeResult result = Probe("127.0.0.1", device.Port(), SHORT_TIMEOUT);
    EXPECT_EQ(result.error, ProbeError::Timeout);
    EXPECT_TRUE(result.body.is_null());
}

TEST(ProbeClientTest, ClosedPortIsUnreachable)
{
    ProbeResult result = Probe("127.0.0.1", FakeDevice::ClosedPort(), SHORT_TIMEOUT);
    EXPECT_EQ(result.error, ProbeError::Unreachable);
}

TEST(ProbeClientTest, InvalidAddressIsUnreachable)
{
    EXPECT_EQ(Probe("not-an-ip", 5000, SHORT_TIMEOUT).error, ProbeError::Unreachable);
}

TEST(ProbeClientTest, ErrorNames)
{
    EXPECT_EQ(ToString(ProbeError::Timeout), "Timeout");
    EXPECT_EQ(ToString(ProbeError::BadStatus), "BadStatus");
}
