#include "CommandWorker.hpp"
#include "../common/HttpClient.hpp"

#include <iostream>

namespace fleet_ops::server
{
    CommandWorker::CommandWorker(std::chrono::milliseconds timeout, std::size_t workers, std::size_t backlog)
        : running_(false), timeout_(timeout), workers_(workers), backlog_(backlog)
    {
    }

    CommandWorker::~CommandWorker()
    {
        Stop();
    }

    void CommandWorker::Start()
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (running_)
            return;
        pool_ = std::make_unique<discovery::WorkerPool>(workers_, backlog_);
        running_ = true;
    }

    void CommandWorker::Stop()
    {
        std::unique_ptr<discovery::WorkerPool> pool;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!running_)
                return;
            running_ = false;
            pool = std::move(pool_);
        }

        if (pool)
            pool->Drain();
    }

    bool CommandWorker::AddJob(uint64_t connection_id, CommandJob command)
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!running_ || !pool_)
            return false;

        Job job{connection_id, std::move(command)};
        return pool_->TrySubmit([this, job]()
                                { Process(job); });
    }

    http::Response CommandWorker::Forward(const CommandJob &command, std::chrono::milliseconds timeout)
    {
        const common::DeviceRecord &target = command.target;

        http::Request req;
        req.method = "POST";
        req.target = "/api/" + command.command;
        req.headers["content-type"] = "application/json";

        http::ExchangeResult result = http::Exchange(target.ip, target.port, req, timeout);

        switch (result.error)
        {
        case http::ExchangeError::None:
        {
            http::Response relayed;
            relayed.status = result.response.status;
            relayed.reason = result.response.reason;
            relayed.body = result.response.body;

            auto type = result.response.headers.find("content-type");
            relayed.headers["content-type"] = type != result.response.headers.end() ? type->second : "application/json";
            return relayed;
        }
        case http::ExchangeError::Timeout:
            return http::MakeErrorResponse(504, "Device " + command.device_id + " did not answer in time");
        default:
            return http::MakeErrorResponse(502, "Device " + command.device_id + " unavailable: " + result.detail);
        }
    }

    void CommandWorker::Process(Job job)
    {
        http::Response response;
        if (!running_)
        {
            response = http::MakeErrorResponse(503, "Server shutting down");
        }
        else
        {
            try
            {
                std::cout << "[Worker] Forwarding " << job.command.command << " to "
                          << job.command.device_id << " at " << job.command.target.BaseUrl() << "\n";
                response = Forward(job.command, timeout_);
                if (response.status >= 400)
                    std::cerr << "[Worker] " << job.command.device_id << " answered " << response.status << "\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Worker] Error processing job: " << e.what() << "\n";
                response = http::MakeErrorResponse(502, e.what());
            }
        }

        if (responder_)
            responder_(job.connection_id, std::move(response));
    }
}
