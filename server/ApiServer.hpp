#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/HttpBuffer.hpp"
#include "../common/Service.hpp"
#include "../common/StopToken.hpp"
#include "../monitor/FleetDirectory.hpp"
#include "CommandWorker.hpp"
#include "FleetApi.hpp"

namespace fleet_ops::server
{
    struct ClientContext
    {
        int socketfd = -1;
        uint64_t id = 0;
        SSL *ssl_handle = nullptr;
        http::HttpBuffer buff;
        bool is_handshake_complete = false;
        bool awaiting_command = false;
        std::chrono::steady_clock::time_point accepted_at;
    };

    // Single-threaded epoll front end for the fleet API. One request per
    // connection; the response is written and the connection closed. Device
    // commands are handed to the CommandWorker and their responses come back
    // through QueueResponse().
    class ApiServer : public common::Service
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;
        std::map<uint64_t, int> m_connections;
        uint64_t m_next_id;

        SSL_CTX *m_ssl_ctx;
        std::string m_cert_path;
        std::string m_key_path;

        FleetApi m_api;
        CommandWorker &m_worker;

        std::mutex m_outbox_mutex;
        std::vector<std::pair<uint64_t, http::Response>> m_outbox;

        std::thread m_thread;
        common::StopToken *m_token;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        bool ReadAvailable(ClientContext &ctx, bool &peer_closed);

        void ProcessRequest(int fd, const http::Request &req);
        void SendResponse(int fd, const http::Response &resp);
        bool WriteAll(ClientContext &ctx, const std::string &data);

        void DrainOutbox();
        void SweepIdle();

    public:
        static constexpr std::chrono::seconds IDLE_TIMEOUT{10};

        ApiServer(const monitor::FleetDirectory &directory, CommandWorker &worker, int port,
                  std::string cert_path = "", std::string key_path = "");
        ~ApiServer();

        // Binds and listens; throws std::runtime_error on failure. Port 0
        // picks an ephemeral port, readable through Port() afterwards.
        void Init();
        void Run();

        void Start(common::StopToken &token) override;
        void Stop() override;
        std::string Name() const override { return "ApiServer"; }

        // Thread-safe. Wakes the event loop to write the response.
        void QueueResponse(uint64_t connection_id, http::Response resp);

        int Port() const { return m_port; }
        bool TlsEnabled() const { return m_ssl_ctx != nullptr; }
    };
}
