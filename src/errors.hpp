#pragma once

#include <stdexcept>
#include <string>

namespace faketime
{
    // Base for every error raised by the engine itself. Exceptions thrown by
    // application callbacks are never wrapped.
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Negative duration handed to elapse/elapse_blocking.
    class InvalidArgumentError final : public Error
    {
    public:
        using Error::Error;
    };

    // Operation not permitted in the current state (nested elapse, failed invariant).
    class IllegalStateError final : public Error
    {
    public:
        using Error::Error;
    };

    // flush_timers would have to move past its configured timeout.
    class TimeoutError final : public Error
    {
    public:
        using Error::Error;
    };

    class UnimplementedError final : public Error
    {
    public:
        using Error::Error;
    };
}
