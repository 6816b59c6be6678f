/*
Purpose: Reentrancy rules of elapse() and elapse_blocking().

What this tests:
- elapse() from inside a timer or microtask throws IllegalStateError and leaves the
  outer elapse running with its own target.
- elapse_blocking() from inside elapse() stretches the horizon instead of being capped.
- flush_timers() from inside elapse() may run past the target without tripping invariant checks.
- An exception escaping a callback clears the elapse cursor and leaves the registry usable.
*/

#include "scheduler.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

int main()
{
    // Nested elapse from a timer callback.
    {
        faketime::Scheduler sched;
        bool nestedThrew = false;
        bool stillElapsing = false;
        int laterFired = 0;

        sched.create_one_shot_timer(1s, [&]
                                    {
            try
            {
                sched.elapse(1s);
            }
            catch (const faketime::IllegalStateError &)
            {
                nestedThrew = true;
            }
            stillElapsing = sched.is_elapsing(); });
        sched.create_one_shot_timer(2s, [&]
                                    { ++laterFired; });

        sched.elapse(3s);
        assert(nestedThrew);
        assert(stillElapsing);
        assert(laterFired == 1);
        assert(sched.elapsed() == 3s);
        assert(!sched.is_elapsing());
    }

    // Nested elapse from a microtask drained at the start of elapse.
    {
        faketime::Scheduler sched;
        bool nestedThrew = false;
        sched.schedule_microtask([&]
                                 {
            try
            {
                sched.elapse(0us);
            }
            catch (const faketime::IllegalStateError &)
            {
                nestedThrew = true;
            } });
        sched.elapse(1s);
        assert(nestedThrew);
        assert(sched.elapsed() == 1s);
    }

    // elapse_blocking inside a timer extends the horizon of the running elapse.
    {
        faketime::Scheduler sched;
        std::vector<faketime::Duration> at12;
        int at20 = 0;

        sched.create_one_shot_timer(5s, [&]
                                    { sched.elapse_blocking(10s); });
        sched.create_one_shot_timer(12s, [&]
                                    { at12.push_back(sched.elapsed()); });
        sched.create_one_shot_timer(20s, [&]
                                    { ++at20; });

        sched.elapse(10s);
        assert((at12 == std::vector<faketime::Duration>{15s}));
        assert(at20 == 0);
        assert(sched.elapsed() == 15s);

        sched.elapse(5s);
        assert(at20 == 1);
        assert(sched.elapsed() == 20s);
    }

    // elapse_blocking that stays inside the horizon does not shorten it.
    {
        faketime::Scheduler sched;
        int fired = 0;
        sched.schedule_microtask([&]
                                 { sched.elapse_blocking(1s); });
        sched.create_one_shot_timer(8s, [&]
                                    { ++fired; });
        sched.elapse(10s);
        assert(fired == 1);
        assert(sched.elapsed() == 10s);
    }

    // elapse_blocking outside elapse runs nothing; the next elapse catches up.
    {
        faketime::Scheduler sched;
        faketime::Duration firedAt = -1us;
        sched.create_one_shot_timer(1s, [&]
                                    { firedAt = sched.elapsed(); });
        sched.elapse_blocking(5s);
        assert(firedAt == -1us);
        assert(sched.elapsed() == 5s);

        sched.elapse(0us);
        assert(firedAt == 5s);
        assert(sched.elapsed() == 5s);
    }

    // A throwing one-shot callback: cursor cleared, timer gone, later timers intact.
    {
        faketime::Scheduler sched;
        int laterFired = 0;
        sched.create_one_shot_timer(1s, []
                                    { throw std::runtime_error("callback failed"); });
        sched.create_one_shot_timer(3s, [&]
                                    { ++laterFired; });

        bool threw = false;
        try
        {
            sched.elapse(5s);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        assert(!sched.is_elapsing());
        assert(sched.elapsed() == 1s);
        assert(sched.non_periodic_timer_count() == 1);

        sched.elapse(1s);
        assert(laterFired == 0);
        sched.elapse(1s);
        assert(laterFired == 1);
    }

    // A throwing periodic callback is not re-armed for that firing.
    {
        faketime::Scheduler sched;
        int fired = 0;
        auto h = sched.create_periodic_timer(1s, [&](faketime::TimerHandle)
                                             {
            ++fired;
            if (fired == 1)
            {
                throw std::runtime_error("first tick failed");
            } });

        bool threw = false;
        try
        {
            sched.elapse(1s);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
        assert(h.is_active());
        assert(sched.next_fire_time() == std::optional<faketime::Duration>(1s));

        sched.elapse(0us);
        assert(fired == 2);
        assert(sched.next_fire_time() == std::optional<faketime::Duration>(2s));
        h.cancel();
    }

    // A timer that flushes all timers while elapse() is running.
    {
        faketime::SchedulerConfig cfg;
        cfg.enableInvariantChecks = true;
        faketime::Scheduler sched(cfg);
        std::vector<faketime::Duration> firedAt;
        sched.create_one_shot_timer(1s, [&]
                                    {
            firedAt.push_back(sched.elapsed());
            sched.flush_timers(); });
        sched.create_one_shot_timer(10s, [&]
                                    { firedAt.push_back(sched.elapsed()); });

        sched.elapse(2s);
        assert((firedAt == std::vector<faketime::Duration>{1s, 10s}));
        assert(sched.elapsed() == 10s);
        assert(!sched.is_elapsing());
        assert(sched.non_periodic_timer_count() == 0);

        sched.elapse(1s);
        assert(sched.elapsed() == 11s);
    }

    return 0;
}
