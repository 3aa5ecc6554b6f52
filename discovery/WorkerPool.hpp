#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>
#include "../common/ThreadSafeQueue.hpp"

namespace fleet_ops::discovery
{
    // Fixed set of threads draining a bounded job queue. The number of jobs
    // in flight never exceeds the worker count, however many are submitted.
    class WorkerPool
    {
    public:
        using Job = std::function<void()>;

        WorkerPool(std::size_t workers, std::size_t queue_capacity);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        // Blocks while the queue is full. False once Drain() has started.
        bool Submit(Job job);

        // Never blocks. False when the queue is full or draining.
        bool TrySubmit(Job job);

        // Stops accepting jobs, runs everything already queued, joins.
        void Drain();

        std::size_t WorkerCount() const { return m_threads.size(); }
        std::size_t PeakActive() const { return m_peak_active; }

    private:
        void ProcessLoop();

        std::vector<std::thread> m_threads;
        common::ThreadSafeQueue<Job> m_queue;
        std::atomic<std::size_t> m_active;
        std::atomic<std::size_t> m_peak_active;
    };
}
