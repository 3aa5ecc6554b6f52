#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include "../common/Service.hpp"
#include "../common/StopToken.hpp"
#include "../discovery/ProbeClient.hpp"
#include "FleetDirectory.hpp"

namespace fleet_ops::monitor
{
    class HealthPoller : public common::Service
    {
    public:
        HealthPoller(FleetDirectory &directory,
                     std::chrono::milliseconds interval,
                     std::chrono::milliseconds probe_timeout = discovery::DEFAULT_POLL_TIMEOUT,
                     discovery::ProbeFunction probe = discovery::Probe,
                     std::size_t max_concurrency = 32);
        ~HealthPoller();

        void Start(common::StopToken &token) override;
        void Stop() override;
        std::string Name() const override { return "HealthPoller"; }

        // One cycle: a single read of the directory up front, then every
        // device probed concurrently. Each result is written as soon as its
        // probe returns. Returns the number of devices probed.
        std::size_t PollOnce(common::StopToken *token = nullptr);

        static common::HealthObservation Classify(const discovery::ProbeResult &result,
                                                  std::chrono::system_clock::time_point observed_at);

        uint64_t Cycles() const { return m_cycles; }

    private:
        void MonitorLoop();
        void LogTransition(const std::string &device_id, common::HealthStatus status,
                           const discovery::ProbeResult &result);

        FleetDirectory &m_directory;
        std::chrono::milliseconds m_interval;
        std::chrono::milliseconds m_probe_timeout;
        discovery::ProbeFunction m_probe;
        std::size_t m_max_concurrency;

        std::atomic<bool> m_running;
        std::atomic<uint64_t> m_cycles;
        std::thread m_thread;
        common::StopToken *m_token;

        std::mutex m_status_mutex;
        std::map<std::string, common::HealthStatus> m_last_status;
    };
}
