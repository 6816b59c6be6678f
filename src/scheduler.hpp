#pragma once

#include "capture.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "microtask_queue.hpp"
#include "timer_registry.hpp"
#include "virtual_clock.hpp"

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace faketime
{
    struct SchedulerConfig
    {
        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Periodic timers re-arm by at least this much. Keeps a zero-period timer
        // from firing forever inside a single elapse(). Must be positive.
        Duration minPeriodicStep{1};

        // Enable extra runtime invariant checks (throws on violation).
#if defined(FAKETIME_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (FAKETIME_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    struct FlushTimersOptions
    {
        // Virtual time flush_timers may cover, measured from the elapsed value at
        // the start of the call.
        Duration timeout = std::chrono::hours(1);

        // If false, stop once only periodic timers remain and every one of them
        // has had a chance to fire at the final elapsed value.
        bool flushPeriodicTimers = true;
    };

    // Deterministic virtual-time driver for asynchronous code under test.
    //
    // Code run inside run() creates timers and microtasks through the capture
    // boundary; nothing fires until the test calls elapse(), flush_timers() or
    // flush_microtasks(). Everything happens synchronously on the calling thread.
    class Scheduler final : public ICaptureBoundary
    {
    public:
        struct Stats
        {
            Duration elapsed = Duration::zero();
            std::size_t pendingPeriodic = 0;
            std::size_t pendingNonPeriodic = 0;
            std::size_t pendingMicrotasks = 0;

            // Monotonic counters.
            std::uint64_t oneShotCreated = 0;
            std::uint64_t periodicCreated = 0;
            std::uint64_t timersFired = 0;
            std::uint64_t timersCancelled = 0;
            std::uint64_t microtasksRun = 0;
            std::uint64_t elapseCalls = 0;
        };

        explicit Scheduler(SchedulerConfig cfg = {}) : m_cfg(cfg)
        {
            if (m_cfg.minPeriodicStep <= Duration::zero())
            {
                throw InvalidArgumentError("Scheduler: minPeriodicStep must be positive");
            }

            Logger::instance().set_level(m_cfg.logLevel);
        }

        // Handles and clock readers point into this object.
        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        // Runs `fn(*this)` with this scheduler installed as the thread's capture
        // boundary and returns its result. The previous boundary is restored on
        // every exit path.
        template <class Fn>
        decltype(auto) run(Fn &&fn)
        {
            CaptureScope scope(*this);
            return std::forward<Fn>(fn)(*this);
        }

        // Simulates the asynchronous passage of `duration`. Every timer due within
        // the new horizon fires in (nextFire, creation) order, with microtasks
        // drained before the first timer and after each one.
        void elapse(Duration duration)
        {
            if (duration < Duration::zero())
            {
                throw InvalidArgumentError("elapse: duration may not be negative (got " +
                                           std::to_string(to_micros(duration)) + "us)");
            }
            if (m_elapsingTo.has_value())
            {
                throw IllegalStateError("elapse: cannot elapse until previous elapse is complete");
            }
            if (add_overflows(m_clock.elapsed(), duration))
            {
                throw InvalidArgumentError("elapse: duration of " + std::to_string(to_micros(duration)) +
                                           "us overflows elapsed time");
            }

            m_elapsingTo = m_clock.elapsed() + duration;
            ElapseCursorReset reset{m_elapsingTo};
            ++m_elapseCalls;

            Logger::instance().logf(LogLevel::Debug, m_clock.elapsed(), "elapse: start target=%lldus",
                                    to_micros(*m_elapsingTo));

            fire_while_([this](const TimerEntry &next)
                        { return next.nextFire <= *m_elapsingTo; });
            m_clock.advance_to(*m_elapsingTo);

            validate_invariants_("elapse:exit");
            Logger::instance().logf(LogLevel::Debug, m_clock.elapsed(), "elapse: done");
        }

        // Simulates time consumed by a blocking call. Runs nothing. When called from
        // inside elapse(), stretches that call's horizon if it moves past it.
        void elapse_blocking(Duration duration)
        {
            if (duration < Duration::zero())
            {
                throw InvalidArgumentError("elapse_blocking: duration may not be negative (got " +
                                           std::to_string(to_micros(duration)) + "us)");
            }
            if (add_overflows(m_clock.elapsed(), duration))
            {
                throw InvalidArgumentError("elapse_blocking: duration of " + std::to_string(to_micros(duration)) +
                                           "us overflows elapsed time");
            }

            m_clock.advance_by(duration);
            stretch_elapse_target_();

            Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "elapse_blocking: +%lldus",
                                    to_micros(duration));
        }

        // Runs microtasks until none are pending. Does not fire timers.
        void flush_microtasks()
        {
            CaptureScope scope(*this);
            drain_microtasks_();
        }

        // Elapses time until no timers are left to fire (see FlushTimersOptions).
        // Throws TimeoutError if the next timer is due past elapsed + timeout.
        // A timeout of Duration::max() never expires.
        void flush_timers(FlushTimersOptions opts = {})
        {
            const Duration absoluteTimeout = saturating_add(m_clock.elapsed(), opts.timeout);

            fire_while_([&](const TimerEntry &next)
                        {
                if (next.nextFire > absoluteTimeout)
                {
                    Logger::instance().logf(LogLevel::Warn, m_clock.elapsed(),
                                            "flush_timers: timer id=%llu due at %lldus is past the timeout",
                                            static_cast<unsigned long long>(next.id),
                                            to_micros(next.nextFire));
                    throw TimeoutError("flush_timers: exceeded timeout of " +
                                       std::to_string(to_micros(opts.timeout)) + "us while flushing timers");
                }

                if (opts.flushPeriodicTimers)
                {
                    return !m_timers.empty();
                }

                // Keep going until only periodic timers are left and each of them
                // has had a chance to run against the final elapsed value.
                const Duration now = m_clock.elapsed();
                return m_timers.any_of([now](const TimerEntry &t)
                                       { return !t.is_periodic() || t.nextFire <= now; }); });

            validate_invariants_("flush_timers:exit");
        }

        TimerHandle create_one_shot_timer(Duration delay, OneShotCallback callback) override
        {
            if (!callback)
            {
                throw InvalidArgumentError("create_one_shot_timer: null callback");
            }
            const Duration nextFire = saturating_add(m_clock.elapsed(), clamp_non_negative(delay));
            const TimerId id = m_timers.insert(nextFire, OneShotTimer{std::move(callback)});

            Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "timer id=%llu one-shot due=%lldus",
                                    static_cast<unsigned long long>(id), to_micros(nextFire));
            return TimerHandle(&m_timers, id);
        }

        TimerHandle create_periodic_timer(Duration period, PeriodicCallback callback) override
        {
            if (!callback)
            {
                throw InvalidArgumentError("create_periodic_timer: null callback");
            }
            const Duration p = clamp_non_negative(period);
            const TimerId id = m_timers.insert(saturating_add(m_clock.elapsed(), p), PeriodicTimer{p, std::move(callback)});

            Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "timer id=%llu periodic period=%lldus",
                                    static_cast<unsigned long long>(id), to_micros(p));
            return TimerHandle(&m_timers, id);
        }

        void schedule_microtask(Microtask task) override
        {
            m_microtasks.enqueue(std::move(task));
        }

        // Reads base + elapsed live; later elapse()/elapse_blocking() calls show up.
        ClockReader get_clock(Instant base) const
        {
            return ClockReader(m_clock, base);
        }

        Duration elapsed() const noexcept { return m_clock.elapsed(); }

        bool is_elapsing() const noexcept { return m_elapsingTo.has_value(); }

        // nextFire of the timer that would fire next, if any.
        std::optional<Duration> next_fire_time() const
        {
            const TimerEntry *next = m_timers.earliest();
            if (!next)
            {
                return std::nullopt;
            }
            return next->nextFire;
        }

        std::size_t periodic_timer_count() const noexcept { return m_timers.periodic_count(); }

        std::size_t non_periodic_timer_count() const noexcept { return m_timers.non_periodic_count(); }

        std::size_t microtask_count() const noexcept { return m_microtasks.size(); }

        Stats stats() const
        {
            Stats out;
            out.elapsed = m_clock.elapsed();
            out.pendingPeriodic = m_timers.periodic_count();
            out.pendingNonPeriodic = m_timers.non_periodic_count();
            out.pendingMicrotasks = m_microtasks.size();

            const auto &totals = m_timers.totals();
            out.oneShotCreated = totals.oneShotCreated;
            out.periodicCreated = totals.periodicCreated;
            out.timersCancelled = totals.cancelled;
            out.timersFired = m_timersFired;
            out.microtasksRun = m_microtasks.total_run();
            out.elapseCalls = m_elapseCalls;
            return out;
        }

    private:
        // Clears the in-flight elapse target on every exit path of elapse().
        struct ElapseCursorReset
        {
            std::optional<Duration> &cursor;

            ~ElapseCursorReset() { cursor.reset(); }
        };

        void invariant_or_throw_(bool ok, const char *where, const char *msg) const
        {
            if (!ok)
            {
                throw IllegalStateError(std::string(where) + ": " + msg);
            }
        }

        void validate_invariants_(const char *where) const
        {
            if (!m_cfg.enableInvariantChecks)
            {
                return;
            }

            invariant_or_throw_(m_clock.elapsed() >= Duration::zero(), where, "invariant: elapsed is negative");
            if (m_elapsingTo.has_value())
            {
                invariant_or_throw_(m_clock.elapsed() <= *m_elapsingTo, where, "invariant: elapsed ahead of elapse target");
            }
            invariant_or_throw_(m_timers.index_consistent(), where, "invariant: timer index out of sync with entries");
        }

        // A blocking call or a nested flush_timers() may carry the clock past the
        // running elapse() target; the target follows it.
        void stretch_elapse_target_() noexcept
        {
            if (m_elapsingTo.has_value() && m_clock.elapsed() > *m_elapsingTo)
            {
                m_elapsingTo = m_clock.elapsed();
            }
        }

        void drain_microtasks_()
        {
            const std::size_t ran = m_microtasks.drain_all();
            if (ran != 0)
            {
                Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "drained %zu microtasks", ran);
            }
        }

        // Shared loop of elapse() and flush_timers(). Microtasks drain before the
        // registry is inspected and after every single firing. Callbacks run with
        // this scheduler installed, so work they schedule is captured as well.
        template <class Pred>
        void fire_while_(Pred &&pred)
        {
            CaptureScope scope(*this);
            drain_microtasks_();
            while (true)
            {
                const TimerEntry *next = m_timers.earliest();
                if (!next)
                {
                    break;
                }
                if (!pred(*next))
                {
                    break;
                }

                m_clock.advance_to(next->nextFire);
                stretch_elapse_target_();
                fire_(next->id);
                drain_microtasks_();
                validate_invariants_("fire:exit");
            }
        }

        void fire_(TimerId id)
        {
            const TimerEntry *entry = m_timers.find(id);
            if (!entry)
            {
                throw IllegalStateError("fire: timer is not registered");
            }

            // Hold the callback: the timer may be cancelled from inside it.
            const std::shared_ptr<TimerKind> kind = entry->kind;
            const Duration firedAt = entry->nextFire;
            ++m_timersFired;

            if (auto *periodic = std::get_if<PeriodicTimer>(kind.get()))
            {
                Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "fire periodic id=%llu",
                                        static_cast<unsigned long long>(id));
                periodic->callback(TimerHandle(&m_timers, id));

                // Fixed cadence from creation; no catch-up skipping.
                const Duration step = std::max(periodic->period, m_cfg.minPeriodicStep);
                m_timers.reschedule(id, saturating_add(firedAt, step));
                return;
            }

            // Deactivate first so the callback sees its own handle as inactive.
            m_timers.remove(id);
            Logger::instance().logf(LogLevel::Trace, m_clock.elapsed(), "fire one-shot id=%llu",
                                    static_cast<unsigned long long>(id));
            std::get<OneShotTimer>(*kind).callback();
        }

        SchedulerConfig m_cfg;

        VirtualClock m_clock;
        TimerRegistry m_timers;
        MicrotaskQueue m_microtasks;

        // Target of the elapse() currently running, if any.
        std::optional<Duration> m_elapsingTo;

        std::uint64_t m_timersFired = 0;
        std::uint64_t m_elapseCalls = 0;
    };
}
