#pragma once

#include "common.hpp"

namespace faketime
{
    // Elapsed virtual time since the owning Scheduler was created.
    // Never decreases; only the Scheduler mutates it.
    class VirtualClock
    {
    public:
        Duration elapsed() const noexcept { return m_elapsed; }

        Instant now(Instant base) const noexcept { return base + m_elapsed; }

        // No-op when `target` is not ahead of the current value.
        void advance_to(Duration target) noexcept
        {
            if (target > m_elapsed)
            {
                m_elapsed = target;
            }
        }

        // `d` must be non-negative; the Scheduler validates before calling.
        void advance_by(Duration d) noexcept
        {
            m_elapsed += d;
        }

    private:
        Duration m_elapsed = Duration::zero();
    };

    // Reads base + elapsed from a live clock. Holds a reference, not a snapshot,
    // so it must not outlive the Scheduler it came from.
    class ClockReader
    {
    public:
        ClockReader(const VirtualClock &clock, Instant base) : m_clock(&clock), m_base(base) {}

        Instant now() const noexcept { return m_clock->now(m_base); }

        Instant operator()() const noexcept { return now(); }

        Instant ago(Duration d) const noexcept { return now() - d; }

        Instant from_now(Duration d) const noexcept { return now() + d; }

        Instant base() const noexcept { return m_base; }

    private:
        const VirtualClock *m_clock = nullptr;
        Instant m_base{};
    };
}
