#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <mutex>
#include <thread>
#include <vector>

#include "FakeDevice.hpp"
#include "common/HttpClient.hpp"
#include "common/StopToken.hpp"
#include "server/ApiServer.hpp"
#include "server/CommandWorker.hpp"
#include "server/FleetApi.hpp"

using namespace fleet_ops;
using fakes::FakeDevice;

namespace
{
    http::Request Make(const std::string &method, const std::string &target)
    {
        http::Request req;
        req.method = method;
        req.target = target;
        return req;
    }

    // Writes raw bytes to the server and reads until it closes.
    std::string SendRaw(int port, const std::string &raw)
    {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd == -1)
            return "";

        timeval tv{3, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0)
        {
            close(fd);
            return "";
        }

        send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);

        std::string reply;
        char buf[1024];
        ssize_t n;
        while ((n = recv(fd, buf, sizeof(buf), 0)) > 0)
            reply.append(buf, static_cast<std::size_t>(n));
        close(fd);
        return reply;
    }

    common::DeviceRecord Device(const std::string &id, const std::string &ip, int port = 5000)
    {
        return common::DeviceRecord{id, ip, port, id};
    }

    class ApiServerTest : public ::testing::Test
    {
    protected:
        ApiServerTest()
            : worker(std::chrono::milliseconds(300)), server(directory, worker, 0)
        {
        }

        void SetUp() override
        {
            server.Init();
            server.Start(token);
        }

        void TearDown() override
        {
            token.RequestStop();
            server.Stop();
        }

        http::ExchangeResult Send(const std::string &method, const std::string &target)
        {
            return http::Exchange("127.0.0.1", server.Port(), Make(method, target), std::chrono::seconds(3));
        }

        monitor::FleetDirectory directory;
        server::CommandWorker worker;
        server::ApiServer server;
        common::StopToken token;
    };
}

TEST(FleetApiTest, RoutesReadsAndCommands)
{
    monitor::FleetDirectory directory;
    directory.UpsertRecords({Device("pi-01", "10.0.0.5")});
    server::FleetApi api(directory);

    auto list = api.Route(Make("GET", "/api/devices"));
    ASSERT_TRUE(list.response.has_value());
    EXPECT_EQ(list.response->status, 200);

    auto one = api.Route(Make("GET", "/api/devices/pi-01?verbose=1"));
    ASSERT_TRUE(one.response.has_value());
    EXPECT_EQ(nlohmann::json::parse(one.response->body)["device_id"], "pi-01");

    auto toggle = api.Route(Make("POST", "/api/device/pi-01/toggle_recording"));
    ASSERT_TRUE(toggle.command.has_value());
    EXPECT_FALSE(toggle.response.has_value());
    EXPECT_EQ(toggle.command->command, "toggle_recording");
    EXPECT_EQ(toggle.command->target.ip, "10.0.0.5");

    EXPECT_EQ(api.Route(Make("POST", "/api/device/pi-01/sync")).command->command, "sync");
}

TEST(FleetApiTest, RejectsUnknownTargets)
{
    monitor::FleetDirectory directory;
    directory.UpsertRecords({Device("pi-01", "10.0.0.5")});
    server::FleetApi api(directory);

    EXPECT_EQ(api.Route(Make("GET", "/api/devices/ghost")).response->status, 404);
    EXPECT_EQ(api.Route(Make("POST", "/api/device/ghost/toggle_recording")).response->status, 404);
    EXPECT_EQ(api.Route(Make("POST", "/api/device/pi-01/reboot")).response->status, 404);
    EXPECT_EQ(api.Route(Make("GET", "/")).response->status, 404);
    EXPECT_EQ(api.Route(Make("GET", "/api/other")).response->status, 404);
    EXPECT_EQ(api.Route(Make("DELETE", "/api/devices")).response->status, 405);
    EXPECT_EQ(api.Route(Make("GET", "/api/device/pi-01/toggle_recording")).response->status, 405);
}

TEST(FleetApiTest, DecodesEscapedIds)
{
    monitor::FleetDirectory directory;
    directory.UpsertRecords({Device("Garage Cam", "10.0.0.7")});
    server::FleetApi api(directory);

    EXPECT_EQ(api.Route(Make("GET", "/api/devices/Garage%20Cam")).response->status, 200);
    EXPECT_EQ(server::FleetApi::PercentDecode("a%2Fb%zz%4"), "a/b%zz%4");
}

TEST_F(ApiServerTest, ListsDevicesWithHealth)
{
    auto empty = Send("GET", "/api/devices");
    ASSERT_TRUE(empty.Ok()) << empty.detail;
    EXPECT_EQ(empty.response.status, 200);
    EXPECT_EQ(nlohmann::json::parse(empty.response.body)["count"], 0);

    directory.UpsertRecords({Device("pi-01", "10.0.0.5"), Device("pi-02", "10.0.0.6")});
    common::HealthObservation online;
    online.status = common::HealthStatus::Online;
    online.payload = {{"battery", 72}};
    online.observed_at = std::chrono::system_clock::now();
    directory.WriteHealth("pi-01", online);

    auto result = Send("GET", "/api/devices");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.headers["content-type"], "application/json");

    nlohmann::json body = nlohmann::json::parse(result.response.body);
    ASSERT_EQ(body["count"], 2);
    EXPECT_EQ(body["devices"][0]["device_id"], "pi-01");
    EXPECT_EQ(body["devices"][0]["status"], "online");
    EXPECT_EQ(body["devices"][0]["health"]["battery"], 72);
    EXPECT_EQ(body["devices"][0]["base_url"], "http://10.0.0.5:5000");
    EXPECT_EQ(body["devices"][1]["status"], "unknown");
    EXPECT_TRUE(body["devices"][1]["observed_at"].is_null());
}

TEST_F(ApiServerTest, UnknownDeviceIs404)
{
    auto result = Send("POST", "/api/device/ghost/toggle_recording");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 404);
    EXPECT_TRUE(nlohmann::json::parse(result.response.body).contains("error"));
}

TEST_F(ApiServerTest, MalformedRequestIs400)
{
    std::string reply = SendRaw(server.Port(), "GET no-leading-slash HTTP/1.1\r\n\r\n");
    EXPECT_EQ(reply.rfind("HTTP/1.1 400 ", 0), 0u) << reply;
    EXPECT_NE(reply.find("\"error\""), std::string::npos);
}

TEST_F(ApiServerTest, ToggleIsForwardedToDevice)
{
    FakeDevice device;
    device.SetJson(200, R"({"recording":true})");
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", device.Port())});

    auto result = Send("POST", "/api/device/pi-01/toggle_recording");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 200);
    EXPECT_EQ(nlohmann::json::parse(result.response.body)["recording"], true);

    auto requests = device.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "POST /api/toggle_recording HTTP/1.1");
}

TEST_F(ApiServerTest, SyncIsForwardedToDevice)
{
    FakeDevice device;
    device.SetJson(202, R"({"queued":3})");
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", device.Port())});

    auto result = Send("POST", "/api/device/pi-01/sync");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 202);

    auto requests = device.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "POST /api/sync HTTP/1.1");
}

TEST_F(ApiServerTest, DeviceErrorIsRelayed)
{
    FakeDevice device;
    device.SetJson(500, R"({"error":"camera busy"})");
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", device.Port())});

    auto result = Send("POST", "/api/device/pi-01/toggle_recording");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 500);
    EXPECT_EQ(nlohmann::json::parse(result.response.body)["error"], "camera busy");
}

TEST_F(ApiServerTest, SilentDeviceIs504)
{
    FakeDevice device;
    device.SetSilent();
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", device.Port())});

    auto result = Send("POST", "/api/device/pi-01/toggle_recording");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 504);
}

TEST_F(ApiServerTest, UnreachableDeviceIs502)
{
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", FakeDevice::ClosedPort())});

    auto result = Send("POST", "/api/device/pi-01/sync");
    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 502);
}

TEST_F(ApiServerTest, ReadsStayAvailableWhileCommandPending)
{
    FakeDevice device;
    device.SetSilent();
    directory.UpsertRecords({Device("pi-01", "127.0.0.1", device.Port())});

    std::thread slow([this]()
                     { Send("POST", "/api/device/pi-01/toggle_recording"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto started = std::chrono::steady_clock::now();
    auto result = Send("GET", "/api/devices");
    auto elapsed = std::chrono::steady_clock::now() - started;
    slow.join();

    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 200);
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST_F(ApiServerTest, SilentDeviceDoesNotDelayOtherCommands)
{
    FakeDevice silent;
    silent.SetSilent();
    FakeDevice live;
    live.SetJson(200, R"({"recording":true})");
    directory.UpsertRecords({Device("cam-09", "127.0.0.1", silent.Port()),
                             Device("pi-01", "127.0.0.1", live.Port())});

    std::vector<std::thread> stuck;
    for (int i = 0; i < 3; ++i)
        stuck.emplace_back([this]()
                           { Send("POST", "/api/device/cam-09/toggle_recording"); });
    for (int i = 0; i < 100 && silent.Requests().size() < 3; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto started = std::chrono::steady_clock::now();
    auto result = Send("POST", "/api/device/pi-01/toggle_recording");
    auto elapsed = std::chrono::steady_clock::now() - started;
    for (auto &t : stuck)
        t.join();

    ASSERT_TRUE(result.Ok()) << result.detail;
    EXPECT_EQ(result.response.status, 200);
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST(CommandWorkerTest, FullBacklogRefusesAndStopAnswersQueued)
{
    FakeDevice silent;
    silent.SetSilent();
    server::CommandJob job{"cam-09", "sync", Device("cam-09", "127.0.0.1", silent.Port())};

    std::mutex mutex;
    std::vector<std::pair<uint64_t, int>> answers;
    server::CommandWorker worker(std::chrono::milliseconds(500), 1, 1);
    worker.SetResponder([&](uint64_t id, http::Response resp)
                        {
        std::lock_guard<std::mutex> lock(mutex);
        answers.emplace_back(id, resp.status); });
    worker.Start();

    ASSERT_TRUE(worker.AddJob(1, job));
    for (int i = 0; i < 100 && silent.Requests().empty(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_EQ(silent.Requests().size(), 1u);

    EXPECT_TRUE(worker.AddJob(2, job));
    EXPECT_FALSE(worker.AddJob(3, job));

    worker.Stop();
    EXPECT_FALSE(worker.AddJob(4, job));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(answers.size(), 2u);
    EXPECT_EQ(answers[0].first, 1u);
    EXPECT_EQ(answers[0].second, 504);
    EXPECT_EQ(answers[1].first, 2u);
    EXPECT_EQ(answers[1].second, 503);
    EXPECT_EQ(silent.Requests().size(), 1u);
}

TEST(ApiServerBacklogTest, FullBacklogIs503)
{
    FakeDevice silent;
    silent.SetSilent();
    monitor::FleetDirectory directory;
    directory.UpsertRecords({Device("cam-09", "127.0.0.1", silent.Port())});

    server::CommandWorker worker(std::chrono::milliseconds(800), 1, 1);
    server::ApiServer server(directory, worker, 0);
    common::StopToken token;
    server.Init();
    server.Start(token);

    auto send = [&]()
    {
        return http::Exchange("127.0.0.1", server.Port(), Make("POST", "/api/device/cam-09/sync"),
                              std::chrono::seconds(3));
    };

    std::thread first([&]()
                      { send(); });
    for (int i = 0; i < 100 && silent.Requests().empty(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::thread second([&]()
                       { send(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto refused = send();
    first.join();
    second.join();
    token.RequestStop();
    server.Stop();

    ASSERT_TRUE(refused.Ok()) << refused.detail;
    EXPECT_EQ(refused.response.status, 503);
}
