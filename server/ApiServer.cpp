#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <poll.h>
#include <iostream>

#include "ApiServer.hpp"
#include <netinet/in.h>

namespace fleet_ops::server
{
    namespace
    {
        constexpr int SEND_TIMEOUT_MS = 2000;
        constexpr int LOOP_TICK_MS = 250;
    }

    void ApiServer::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[Server] OpenSSL: " << buf << std::endl;
        }
    }

    void ApiServer::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK: " + std::string(std::strerror(errno)));
        }
    }

    void ApiServer::EpollControlAdd(int fd)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = EPOLLIN;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void ApiServer::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void ApiServer::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        if (it->second.ssl_handle)
        {
            SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }

        EpollControlRemove(fd);
        close(fd);
        m_connections.erase(it->second.id);
        registry.erase(it);
    }

    void ApiServer::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            int client_fd = accept(m_server_fd, static_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return;
                std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            try
            {
                NonBlockingMode(client_fd);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Server] " << e.what() << std::endl;
                close(client_fd);
                continue;
            }

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.id = m_next_id++;
            ctx.accepted_at = std::chrono::steady_clock::now();
            ctx.is_handshake_complete = true;
            m_connections[ctx.id] = client_fd;

            if (m_ssl_ctx)
            {
                SSL *ssl_handle = SSL_new(m_ssl_ctx);
                if (!ssl_handle)
                {
                    LogOpenSSLErrors();
                    m_connections.erase(ctx.id);
                    registry.erase(client_fd);
                    close(client_fd);
                    continue;
                }

                SSL_set_fd(ssl_handle, client_fd);
                ctx.ssl_handle = ssl_handle;
                ctx.is_handshake_complete = false;

                int ret = SSL_accept(ssl_handle);
                if (ret == 1)
                {
                    ctx.is_handshake_complete = true;
                }
                else
                {
                    int ssl_error = SSL_get_error(ssl_handle, ret);
                    if (ssl_error != SSL_ERROR_WANT_READ && ssl_error != SSL_ERROR_WANT_WRITE)
                    {
                        std::cerr << "[Server] Fatal SSL Handshake Error on " << client_fd << ". Disconnecting." << std::endl;
                        LogOpenSSLErrors();
                        SSL_free(ssl_handle);
                        m_connections.erase(ctx.id);
                        registry.erase(client_fd);
                        close(client_fd);
                        continue;
                    }
                }
            }

            EpollControlAdd(client_fd);
        }
    }

    // Reads everything currently available. Returns false on a hard error.
    bool ApiServer::ReadAvailable(ClientContext &ctx, bool &peer_closed)
    {
        char temp_buffer[4096];
        peer_closed = false;

        while (true)
        {
            if (ctx.ssl_handle)
            {
                int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));
                if (count > 0)
                {
                    if (!ctx.awaiting_command)
                        ctx.buff.Append(temp_buffer, static_cast<std::size_t>(count));
                    continue;
                }

                int err = SSL_get_error(ctx.ssl_handle, count);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    return true;
                if (err == SSL_ERROR_ZERO_RETURN)
                {
                    peer_closed = true;
                    return true;
                }
                return false;
            }

            ssize_t count = recv(ctx.socketfd, temp_buffer, sizeof(temp_buffer), 0);
            if (count > 0)
            {
                if (!ctx.awaiting_command)
                    ctx.buff.Append(temp_buffer, static_cast<std::size_t>(count));
                continue;
            }
            if (count == 0)
            {
                peer_closed = true;
                return true;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return true;
            return false;
        }
    }

    void ApiServer::HandleClientData(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        if (ctx.is_handshake_complete == false)
        {
            int ret = SSL_accept(ctx.ssl_handle);

            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
            }
            else
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                {
                    return;
                }
                std::cerr << "[Server] SSL Handshake Failed. Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
        }

        bool peer_closed = false;
        if (!ReadAvailable(ctx, peer_closed))
        {
            DisconnectClient(fd);
            return;
        }

        if (ctx.awaiting_command)
        {
            if (peer_closed)
                DisconnectClient(fd);
            return;
        }

        if (ctx.buff.Overflowed())
        {
            SendResponse(fd, http::MakeErrorResponse(413, "Request too large"));
            return;
        }

        http::Request req;
        switch (ctx.buff.ParseRequest(req))
        {
        case http::ParseState::Complete:
            ProcessRequest(fd, req);
            break;
        case http::ParseState::Invalid:
            SendResponse(fd, http::MakeErrorResponse(400, "Malformed request"));
            break;
        case http::ParseState::Incomplete:
            if (peer_closed)
                DisconnectClient(fd);
            break;
        }
    }

    void ApiServer::ProcessRequest(int fd, const http::Request &req)
    {
        RouteResult result;
        try
        {
            result = m_api.Route(req);
        }
        catch (const monitor::DirectoryLockTimeout &e)
        {
            std::cerr << "[Server] " << e.what() << std::endl;
            SendResponse(fd, http::MakeErrorResponse(500, "Fleet directory busy"));
            return;
        }

        if (result.command)
        {
            ClientContext &ctx = registry[fd];
            const std::string device_id = result.command->device_id;
            if (!m_worker.AddJob(ctx.id, std::move(*result.command)))
            {
                std::cerr << "[Server] Command backlog full, refusing command for " << device_id << std::endl;
                SendResponse(fd, http::MakeErrorResponse(503, "Too many device commands in flight"));
                return;
            }
            ctx.awaiting_command = true;
            ctx.buff.Clear();
            return;
        }

        if (result.response)
        {
            if (result.response->status >= 400)
                std::cerr << "[Server] " << req.method << " " << req.target << " -> " << result.response->status << std::endl;
            SendResponse(fd, *result.response);
        }
    }

    bool ApiServer::WriteAll(ClientContext &ctx, const std::string &data)
    {
        std::size_t sent = 0;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(SEND_TIMEOUT_MS);

        while (sent < data.size())
        {
            short wait_events = POLLOUT;

            if (ctx.ssl_handle)
            {
                int n = SSL_write(ctx.ssl_handle, data.data() + sent, static_cast<int>(data.size() - sent));
                if (n > 0)
                {
                    sent += static_cast<std::size_t>(n);
                    continue;
                }
                int err = SSL_get_error(ctx.ssl_handle, n);
                if (err == SSL_ERROR_WANT_READ)
                    wait_events = POLLIN;
                else if (err != SSL_ERROR_WANT_WRITE)
                    return false;
            }
            else
            {
                ssize_t n = send(ctx.socketfd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n > 0)
                {
                    sent += static_cast<std::size_t>(n);
                    continue;
                }
                if (n < 0 && errno == EINTR)
                    continue;
                if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
                    return false;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return false;

            struct pollfd pfd;
            pfd.fd = ctx.socketfd;
            pfd.events = wait_events;
            pfd.revents = 0;
            if (poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR)
                return false;
        }
        return true;
    }

    void ApiServer::SendResponse(int fd, const http::Response &resp)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        if (!WriteAll(it->second, http::SerializeResponse(resp)))
        {
            std::cerr << "[Server] Failed to write response to client " << fd << std::endl;
        }
        DisconnectClient(fd);
    }

    void ApiServer::QueueResponse(uint64_t connection_id, http::Response resp)
    {
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            m_outbox.emplace_back(connection_id, std::move(resp));
        }

        uint64_t one = 1;
        if (m_wake_fd != -1 && write(m_wake_fd, &one, sizeof(one)) != sizeof(one))
        {
            std::cerr << "[Server] Failed to signal event loop" << std::endl;
        }
    }

    void ApiServer::DrainOutbox()
    {
        uint64_t counter = 0;
        if (read(m_wake_fd, &counter, sizeof(counter)) < 0 && errno != EAGAIN)
        {
            std::cerr << "[Server] Failed to read wake counter" << std::endl;
        }

        std::vector<std::pair<uint64_t, http::Response>> ready;
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            ready.swap(m_outbox);
        }

        for (auto &[connection_id, resp] : ready)
        {
            auto it = m_connections.find(connection_id);
            if (it == m_connections.end())
            {
                // Client hung up while the device command was in flight.
                continue;
            }
            SendResponse(it->second, resp);
        }
    }

    void ApiServer::SweepIdle()
    {
        auto now = std::chrono::steady_clock::now();
        std::vector<int> expired;
        for (const auto &[fd, ctx] : registry)
        {
            if (!ctx.awaiting_command && now - ctx.accepted_at > IDLE_TIMEOUT)
                expired.push_back(fd);
        }
        for (int fd : expired)
        {
            DisconnectClient(fd);
        }
    }

    ApiServer::ApiServer(const monitor::FleetDirectory &directory, CommandWorker &worker, int port,
                         std::string cert_path, std::string key_path)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(port), m_running(false), m_next_id(1),
          m_ssl_ctx(nullptr), m_cert_path(std::move(cert_path)), m_key_path(std::move(key_path)),
          m_api(directory), m_worker(worker), m_token(nullptr)
    {
        m_worker.SetResponder([this](uint64_t connection_id, http::Response resp)
                              { QueueResponse(connection_id, std::move(resp)); });
    }

    ApiServer::~ApiServer()
    {
        Stop();
        m_worker.SetResponder(nullptr);

        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void ApiServer::Init()
    {
        if (!m_cert_path.empty() && !m_key_path.empty())
        {
            m_ssl_ctx = SSL_CTX_new(TLS_server_method());
            if (m_ssl_ctx == nullptr)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to create SSL Context.");
            }

            if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load certificate '" + m_cert_path + "'.");
            }

            if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load private key '" + m_key_path + "'.");
            }

            if (!SSL_CTX_check_private_key(m_ssl_ctx))
            {
                throw std::runtime_error("Private Key does not match the Certificate!");
            }
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind port " + std::to_string(m_port) + ". Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        socklen_t length = sizeof(serverAddress);
        if (getsockname(m_server_fd, (struct sockaddr *)&serverAddress, &length) == 0)
        {
            m_port = ntohs(serverAddress.sin_port);
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd);
        EpollControlAdd(m_wake_fd);
    }

    void ApiServer::Run()
    {
        std::cout << "[Server] Fleet API listening on port " << m_port << (m_ssl_ctx ? " (TLS)" : "") << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running && !(m_token && m_token->StopRequested()))
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, LOOP_TICK_MS)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[Server] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                try
                {
                    if (current_fd == m_server_fd)
                        HandleNewConnection();
                    else if (current_fd == m_wake_fd)
                        DrainOutbox();
                    else
                        HandleClientData(current_fd);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Server] Error on fd " << current_fd << ": " << e.what() << std::endl;
                    if (current_fd != m_server_fd && current_fd != m_wake_fd)
                        DisconnectClient(current_fd);
                }
            }

            SweepIdle();
        }

        std::cout << "[Server] Event loop stopped" << std::endl;
    }

    void ApiServer::Start(common::StopToken &token)
    {
        if (m_running)
            return;
        if (m_epoll_fd == -1)
            Init();

        m_token = &token;
        m_running = true;
        m_worker.Start();
        m_thread = std::thread(&ApiServer::Run, this);
    }

    void ApiServer::Stop()
    {
        m_worker.Stop();
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }
}
