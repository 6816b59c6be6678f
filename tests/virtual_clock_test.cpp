/*
Purpose: VirtualClock and ClockReader.

What this tests:
- advance_to only moves forward; advance_by adds.
- A ClockReader reads base + elapsed live, including ago() and from_now().
- Scheduler::get_clock reflects elapse() and elapse_blocking() after it was taken.
*/

#include "scheduler.hpp"
#include "virtual_clock.hpp"

#include <cassert>
#include <chrono>

using namespace std::chrono_literals;

int main()
{
    const faketime::Instant base = faketime::Instant{} + std::chrono::hours(24 * 365);

    // advance_to never moves backwards.
    {
        faketime::VirtualClock c;
        assert(c.elapsed() == 0us);
        c.advance_to(5s);
        assert(c.elapsed() == 5s);
        c.advance_to(3s);
        assert(c.elapsed() == 5s);
        c.advance_to(5s);
        assert(c.elapsed() == 5s);
        c.advance_by(250ms);
        assert(c.elapsed() == 5250ms);
        assert(c.now(base) == base + 5250ms);
    }

    // A reader tracks the live value rather than a snapshot.
    {
        faketime::VirtualClock c;
        faketime::ClockReader reader(c, base);
        assert(reader.now() == base);
        c.advance_to(2s);
        assert(reader() == base + 2s);
        assert(reader.ago(1s) == base + 1s);
        assert(reader.from_now(1s) == base + 3s);
        assert(reader.base() == base);
    }

    // get_clock follows elapse and elapse_blocking.
    {
        faketime::Scheduler sched;
        sched.elapse(1s);
        const auto clock = sched.get_clock(base);
        assert(clock.now() == base + 1s);
        sched.elapse(2s);
        assert(clock.now() == base + 3s);
        sched.elapse_blocking(500ms);
        assert(clock.now() == base + 3500ms);
    }

    return 0;
}
