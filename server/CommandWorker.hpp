#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include "../common/HttpMessage.hpp"
#include "../discovery/WorkerPool.hpp"
#include "FleetApi.hpp"

namespace fleet_ops::server
{
    struct Job
    {
        uint64_t connection_id;
        CommandJob command;
    };

    // Receives the device's answer (or a gateway error) for a connection.
    using ResponseCallback = std::function<void(uint64_t, http::Response)>;

    // Forwards device commands on a small pool of threads so a slow device
    // never stalls the API's event loop or the commands behind it. The
    // backlog is bounded; AddJob refuses once it is full.
    class CommandWorker
    {
    private:
        std::unique_ptr<discovery::WorkerPool> pool_;
        std::mutex pool_mutex_;
        std::atomic<bool> running_;

        std::chrono::milliseconds timeout_;
        std::size_t workers_;
        std::size_t backlog_;
        ResponseCallback responder_;

        void Process(Job job);

    public:
        explicit CommandWorker(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                               std::size_t workers = 8, std::size_t backlog = 32);
        ~CommandWorker();

        void Start();

        // In-flight forwards finish; jobs still queued are answered 503.
        void Stop();

        void SetResponder(ResponseCallback responder) { responder_ = std::move(responder); }

        // False when the backlog is full or the worker is stopped. Every
        // accepted job gets exactly one responder call.
        bool AddJob(uint64_t connection_id, CommandJob command);

        // POST <base_url>/api/<command>. The device's status and body are
        // relayed as-is; transport failures map to 504 (timeout) or 502.
        static http::Response Forward(const CommandJob &command, std::chrono::milliseconds timeout);
    };
}
