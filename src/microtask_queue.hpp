#pragma once

#include "common.hpp"
#include "errors.hpp"

#include <deque>

namespace faketime
{
    // Strict FIFO of zero-delay callbacks. Unbounded: an application that keeps
    // scheduling microtasks from microtasks never lets drain_all() return, the
    // same way it would starve a real event loop.
    class MicrotaskQueue
    {
    public:
        void enqueue(Microtask task)
        {
            if (!task)
            {
                throw InvalidArgumentError("schedule_microtask: null callback");
            }
            m_queue.push_back(std::move(task));
        }

        // Runs callbacks until the queue is empty, including any enqueued while
        // draining. Returns how many ran. A throwing callback has already been
        // popped, so the rest of the queue stays intact for the next drain.
        std::size_t drain_all()
        {
            std::size_t ran = 0;
            while (!m_queue.empty())
            {
                Microtask task = std::move(m_queue.front());
                m_queue.pop_front();
                ++ran;
                ++m_totalRun;
                task();
            }
            return ran;
        }

        std::size_t size() const noexcept { return m_queue.size(); }

        bool empty() const noexcept { return m_queue.empty(); }

        // Monotonic; counts callbacks that were started, including ones that threw.
        std::uint64_t total_run() const noexcept { return m_totalRun; }

    private:
        std::deque<Microtask> m_queue;
        std::uint64_t m_totalRun = 0;
    };
}
