#include "WorkerPool.hpp"
#include <iostream>

namespace fleet_ops::discovery
{
    WorkerPool::WorkerPool(std::size_t workers, std::size_t queue_capacity)
        : m_queue(queue_capacity), m_active(0), m_peak_active(0)
    {
        if (workers == 0)
            workers = 1;

        m_threads.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
        {
            m_threads.emplace_back(&WorkerPool::ProcessLoop, this);
        }
    }

    WorkerPool::~WorkerPool()
    {
        Drain();
    }

    bool WorkerPool::Submit(Job job)
    {
        return m_queue.Push(std::move(job));
    }

    bool WorkerPool::TrySubmit(Job job)
    {
        return m_queue.TryPush(std::move(job));
    }

    void WorkerPool::Drain()
    {
        m_queue.Shutdown();

        for (auto &thread : m_threads)
        {
            if (thread.joinable())
                thread.join();
        }
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            std::optional<Job> job = m_queue.Pop();
            if (!job)
                break;

            std::size_t active = ++m_active;
            std::size_t peak = m_peak_active.load();
            while (active > peak && !m_peak_active.compare_exchange_weak(peak, active))
            {
            }

            try
            {
                (*job)();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Error processing job: " << e.what() << "\n";
            }

            --m_active;
        }
    }
}
