#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <cstddef>

namespace fleet_ops::common
{
    // Multi-producer/multi-consumer queue. With a non-zero capacity Push()
    // blocks while the queue is full, which keeps producers from outrunning
    // a fixed set of consumers.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::condition_variable m_space_cv;
        std::size_t m_capacity;
        bool m_shutdown = false;

    public:
        explicit ThreadSafeQueue(std::size_t capacity = 0) : m_capacity(capacity) {}

        // Returns false if the queue was shut down before the value fit.
        bool Push(T value)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_capacity > 0)
            {
                m_space_cv.wait(lock, [this]
                                { return m_queue.size() < m_capacity || m_shutdown; });
            }
            if (m_shutdown)
                return false;

            m_queue.push(std::move(value));
            m_cv.notify_one();
            return true;
        }

        // Never blocks. False when the queue is full or shut down.
        bool TryPush(T value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown || (m_capacity > 0 && m_queue.size() >= m_capacity))
                return false;

            m_queue.push(std::move(value));
            m_cv.notify_one();
            return true;
        }

        // Blocks until a value arrives. After Shutdown() the remaining values
        // are still handed out; nullopt means shut down and drained.
        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            m_space_cv.notify_one();
            return value;
        }

        void Shutdown()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_shutdown = true;
            m_cv.notify_all();
            m_space_cv.notify_all();
        }
    };
}
