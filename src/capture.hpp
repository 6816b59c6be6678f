#pragma once

#include "timer_registry.hpp"

namespace faketime
{
    // The three calls a host async runtime makes instead of its native timer and
    // microtask primitives. The runtime looks up the provider with
    // current_boundary() and falls back to its native scheduler when none is
    // installed.
    class ICaptureBoundary
    {
    public:
        virtual ~ICaptureBoundary() = default;

        // Negative delays are treated as zero.
        virtual TimerHandle create_one_shot_timer(Duration delay, OneShotCallback callback) = 0;

        // Negative periods are treated as zero.
        virtual TimerHandle create_periodic_timer(Duration period, PeriodicCallback callback) = 0;

        virtual void schedule_microtask(Microtask task) = 0;
    };

    namespace detail
    {
        inline thread_local ICaptureBoundary *t_currentBoundary = nullptr;
    }

    // Provider installed on this thread, or nullptr outside any CaptureScope.
    inline ICaptureBoundary *current_boundary() noexcept
    {
        return detail::t_currentBoundary;
    }

    // Installs `boundary` for the lifetime of the scope and restores whatever
    // was installed before, so scopes nest and never leak past an exception.
    class CaptureScope
    {
    public:
        explicit CaptureScope(ICaptureBoundary &boundary) noexcept : m_previous(detail::t_currentBoundary)
        {
            detail::t_currentBoundary = &boundary;
        }

        ~CaptureScope()
        {
            detail::t_currentBoundary = m_previous;
        }

        CaptureScope(const CaptureScope &) = delete;
        CaptureScope &operator=(const CaptureScope &) = delete;

    private:
        ICaptureBoundary *m_previous = nullptr;
    };
}
