#pragma once

#include "common.hpp"
#include "errors.hpp"

#include <memory>
#include <variant>

namespace faketime
{
    class TimerRegistry;

    // Caller-side view of a pending timer. Identity is the TimerId, so a handle
    // stays valid after the registry relocates or drops the entry. A handle must
    // not outlive the Scheduler that issued it.
    class TimerHandle
    {
    public:
        TimerHandle() = default;
        TimerHandle(TimerRegistry *registry, TimerId id) noexcept : m_registry(registry), m_id(id) {}

        // Idempotent. Takes effect immediately, even from inside the timer's own callback.
        void cancel() const;

        // True while the timer is still registered. A one-shot timer reports
        // false from inside its own callback.
        bool is_active() const;

        TimerId id() const noexcept { return m_id; }

        // Fire count is deliberately not tracked.
        std::uint64_t tick() const
        {
            throw UnimplementedError("TimerHandle::tick is not supported");
        }

        friend bool operator==(const TimerHandle &a, const TimerHandle &b) noexcept
        {
            return a.m_registry == b.m_registry && a.m_id == b.m_id;
        }

    private:
        TimerRegistry *m_registry = nullptr;
        TimerId m_id = 0;
    };

    using OneShotCallback = std::function<void()>;
    using PeriodicCallback = std::function<void(TimerHandle)>;

    struct OneShotTimer
    {
        OneShotCallback callback;
    };

    struct PeriodicTimer
    {
        Duration period = Duration::zero();
        PeriodicCallback callback;
    };

    using TimerKind = std::variant<OneShotTimer, PeriodicTimer>;

    struct TimerEntry
    {
        TimerId id = 0;
        Duration nextFire = Duration::zero();

        // Shared so the callback survives its own cancellation mid-call.
        std::shared_ptr<TimerKind> kind;

        bool is_periodic() const noexcept
        {
            return kind && std::holds_alternative<PeriodicTimer>(*kind);
        }

        std::optional<Duration> period() const
        {
            if (!is_periodic())
            {
                return std::nullopt;
            }
            return std::get<PeriodicTimer>(*kind).period;
        }
    };
}
