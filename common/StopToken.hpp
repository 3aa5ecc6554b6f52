#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fleet_ops::common
{
    // Shared shutdown signal. Every loop holds a reference to the same token
    // and checks it between cycles; WaitFor() doubles as the loop's sleep.
    class StopToken
    {
    public:
        StopToken() : m_stopped(false) {}

        StopToken(const StopToken &) = delete;
        StopToken &operator=(const StopToken &) = delete;

        void RequestStop()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stopped = true;
            }
            m_cv.notify_all();
        }

        bool StopRequested() const { return m_stopped; }

        // Sleeps for the given duration or until a stop is requested.
        // Returns true if the stop was requested.
        template <typename Rep, typename Period>
        bool WaitFor(std::chrono::duration<Rep, Period> timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            return m_cv.wait_for(lock, timeout, [this]
                                 { return m_stopped.load(); });
        }

    private:
        std::atomic<bool> m_stopped;
        std::mutex m_mutex;
        std::condition_variable m_cv;
    };
}
