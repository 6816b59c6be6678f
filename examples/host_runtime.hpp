#pragma once

#include "capture.hpp"

#include <stdexcept>

// Timer/microtask entry points of a toy async runtime. Application code calls
// these; a test installs a faketime::Scheduler through run() so the calls are
// captured instead of hitting a real event loop. This runtime has no native
// loop of its own, so calling it outside a capture scope is an error.
namespace host
{
    inline faketime::ICaptureBoundary &provider(const char *what)
    {
        faketime::ICaptureBoundary *b = faketime::current_boundary();
        if (!b)
        {
            throw std::runtime_error(std::string(what) + ": no timer provider installed");
        }
        return *b;
    }

    inline faketime::TimerHandle set_timeout(faketime::Duration delay, faketime::OneShotCallback fn)
    {
        return provider("set_timeout").create_one_shot_timer(delay, std::move(fn));
    }

    inline faketime::TimerHandle set_interval(faketime::Duration period, faketime::PeriodicCallback fn)
    {
        return provider("set_interval").create_periodic_timer(period, std::move(fn));
    }

    inline void post(faketime::Microtask fn)
    {
        provider("post").schedule_microtask(std::move(fn));
    }
}
