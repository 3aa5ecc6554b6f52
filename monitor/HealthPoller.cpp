#include "HealthPoller.hpp"
#include "../discovery/WorkerPool.hpp"
#include <algorithm>
#include <iostream>

namespace fleet_ops::monitor
{
    HealthPoller::HealthPoller(FleetDirectory &directory,
                               std::chrono::milliseconds interval,
                               std::chrono::milliseconds probe_timeout,
                               discovery::ProbeFunction probe,
                               std::size_t max_concurrency)
        : m_directory(directory), m_interval(interval), m_probe_timeout(probe_timeout),
          m_probe(std::move(probe)), m_max_concurrency(std::max<std::size_t>(max_concurrency, 1)),
          m_running(false), m_cycles(0), m_token(nullptr)
    {
    }

    HealthPoller::~HealthPoller()
    {
        Stop();
    }

    void HealthPoller::Start(common::StopToken &token)
    {
        if (m_running)
            return;
        m_running = true;
        m_token = &token;
        m_thread = std::thread(&HealthPoller::MonitorLoop, this);
    }

    // Without a stop request on the shared token this waits out the current sleep.
    void HealthPoller::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    common::HealthObservation HealthPoller::Classify(const discovery::ProbeResult &result,
                                                     std::chrono::system_clock::time_point observed_at)
    {
        common::HealthObservation observation;
        observation.observed_at = observed_at;

        switch (result.error)
        {
        case discovery::ProbeError::None:
            observation.status = common::HealthStatus::Online;
            observation.payload = result.body;
            break;
        // Only a well-formed reply with a non-200 status is an error. A reply
        // that is not HTTP or not JSON counts as no reply at all.
        case discovery::ProbeError::BadStatus:
            observation.status = common::HealthStatus::Error;
            break;
        case discovery::ProbeError::Malformed:
        case discovery::ProbeError::Timeout:
        case discovery::ProbeError::Unreachable:
        default:
            observation.status = common::HealthStatus::Offline;
            break;
        }
        return observation;
    }

    std::size_t HealthPoller::PollOnce(common::StopToken *token)
    {
        const std::vector<common::DeviceRecord> devices = m_directory.Records();
        if (devices.empty())
        {
            ++m_cycles;
            return 0;
        }

        std::atomic<std::size_t> probed(0);
        {
            discovery::WorkerPool pool(std::min(devices.size(), m_max_concurrency), devices.size());

            for (const auto &device : devices)
            {
                pool.Submit([this, token, device, &probed]()
                            {
                    if (token && token->StopRequested())
                        return;

                    discovery::ProbeResult result = m_probe(device.ip, device.port, m_probe_timeout);
                    common::HealthObservation observation = Classify(result, std::chrono::system_clock::now());
                    common::HealthStatus status = observation.status;

                    try
                    {
                        m_directory.WriteHealth(device.device_id, std::move(observation));
                    }
                    catch (const DirectoryLockTimeout &e)
                    {
                        std::cerr << "[Poller] " << e.what() << "\n";
                        return;
                    }

                    ++probed;
                    LogTransition(device.device_id, status, result); });
            }

            pool.Drain();
        }

        ++m_cycles;
        return probed;
    }

    void HealthPoller::LogTransition(const std::string &device_id, common::HealthStatus status,
                                     const discovery::ProbeResult &result)
    {
        std::lock_guard<std::mutex> lock(m_status_mutex);

        auto it = m_last_status.find(device_id);
        common::HealthStatus previous = it == m_last_status.end() ? common::HealthStatus::Unknown : it->second;
        if (previous == status)
            return;

        m_last_status[device_id] = status;

        auto &out = status == common::HealthStatus::Online ? std::cout : std::cerr;
        out << "[Poller] " << device_id << ": " << common::ToString(previous) << " -> " << common::ToString(status);
        if (!result.Ok())
            out << " (" << discovery::ToString(result.error) << ": " << result.detail << ")";
        out << "\n";
    }

    void HealthPoller::MonitorLoop()
    {
        std::cout << "[Poller] Polling every " << m_interval.count() << "ms\n";

        while (m_running && !m_token->StopRequested())
        {
            auto started = std::chrono::steady_clock::now();

            try
            {
                PollOnce(m_token);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Poller] Cycle failed: " << e.what() << "\n";
            }

            auto elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed < m_interval && m_token->WaitFor(m_interval - elapsed))
                break;
        }
    }
}
