#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace faketime
{
    // Virtual durations are signed so that negative requests can be detected.
    using Duration = std::chrono::microseconds;
    using Instant = std::chrono::system_clock::time_point;

    // Assigned in creation order starting at 1. 0 never names a live timer.
    using TimerId = std::uint64_t;

    using Microtask = std::function<void()>;

    inline constexpr Duration clamp_non_negative(Duration d) noexcept
    {
        return d < Duration::zero() ? Duration::zero() : d;
    }

    // True when `a + b` does not fit in a Duration. `a` must be non-negative.
    inline constexpr bool add_overflows(Duration a, Duration b) noexcept
    {
        return b > Duration::max() - a;
    }

    // `a + b` pinned to Duration::max() instead of overflowing.
    inline constexpr Duration saturating_add(Duration a, Duration b) noexcept
    {
        return add_overflows(a, b) ? Duration::max() : a + b;
    }

    inline long long to_micros(Duration d) noexcept
    {
        return static_cast<long long>(d.count());
    }
}
