#include "host_runtime.hpp"
#include "scheduler.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

namespace
{
    using namespace std::chrono_literals;

    struct Params
    {
        std::uint32_t failures = 5;
        std::uint64_t initialBackoffMs = 100;
        std::uint64_t maxBackoffMs = 2000;
        std::uint64_t deadlineMs = 30000;
        bool trace = false;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Retry with exponential backoff, driven in virtual time\n"
                  << "  --failures N          attempts that fail before success (default 5)\n"
                  << "  --initial-ms N        first backoff (default 100)\n"
                  << "  --max-backoff-ms N    backoff cap (default 2000)\n"
                  << "  --deadline-ms N       give up after this long (default 30000)\n"
                  << "  --trace               log every timer and microtask\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--failures")
            {
                if (!parse_u32(need(), p.failures))
                    usage_and_exit();
            }
            else if (a == "--initial-ms")
            {
                if (!parse_u64(need(), p.initialBackoffMs))
                    usage_and_exit();
            }
            else if (a == "--max-backoff-ms")
            {
                if (!parse_u64(need(), p.maxBackoffMs))
                    usage_and_exit();
            }
            else if (a == "--deadline-ms")
            {
                if (!parse_u64(need(), p.deadlineMs))
                    usage_and_exit();
            }
            else if (a == "--trace")
            {
                p.trace = true;
            }
            else
            {
                usage_and_exit();
            }
        }

        if (p.initialBackoffMs == 0 || p.maxBackoffMs < p.initialBackoffMs)
        {
            usage_and_exit();
        }
        return p;
    }

    // Endpoint that refuses the first `failures` connection attempts.
    class FlakyEndpoint
    {
    public:
        explicit FlakyEndpoint(std::uint32_t failures) : m_failuresLeft(failures) {}

        bool try_connect()
        {
            ++m_attempts;
            if (m_failuresLeft > 0)
            {
                --m_failuresLeft;
                return false;
            }
            return true;
        }

        std::uint32_t attempts() const noexcept { return m_attempts; }

    private:
        std::uint32_t m_failuresLeft = 0;
        std::uint32_t m_attempts = 0;
    };

    // Application code: knows only the host runtime, never the scheduler.
    class Connector
    {
    public:
        enum class State
        {
            Connecting,
            Connected,
            GaveUp,
        };

        Connector(FlakyEndpoint &endpoint, const Params &p, faketime::ClockReader clock)
            : m_endpoint(endpoint), m_params(p), m_clock(clock), m_backoff(std::chrono::milliseconds(p.initialBackoffMs))
        {
        }

        void start()
        {
            m_deadline = host::set_timeout(std::chrono::milliseconds(m_params.deadlineMs), [this]
                                           {
                m_retry.cancel();
                m_state = State::GaveUp;
                report_("deadline reached, giving up"); });
            host::post([this]
                       { attempt_(); });
        }

        State state() const noexcept { return m_state; }

    private:
        void attempt_()
        {
            if (m_endpoint.try_connect())
            {
                m_deadline.cancel();
                m_state = State::Connected;
                report_("connected");
                return;
            }

            report_("attempt failed, retrying in " + std::to_string(m_backoff.count() / 1000) + "ms");
            m_retry = host::set_timeout(m_backoff, [this]
                                        { attempt_(); });
            m_backoff = std::min(m_backoff * 2, faketime::Duration(std::chrono::milliseconds(m_params.maxBackoffMs)));
        }

        void report_(const std::string &what) const
        {
            const auto sinceBase = m_clock.now() - m_clock.base();
            std::cout << "[+" << std::setw(6)
                      << std::chrono::duration_cast<std::chrono::milliseconds>(sinceBase).count()
                      << "ms] attempt " << m_endpoint.attempts() << ": " << what << "\n";
        }

        FlakyEndpoint &m_endpoint;
        const Params &m_params;
        faketime::ClockReader m_clock;
        faketime::Duration m_backoff;
        faketime::TimerHandle m_retry;
        faketime::TimerHandle m_deadline;
        State m_state = State::Connecting;
    };
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    faketime::SchedulerConfig cfg;
    cfg.logLevel = p.trace ? faketime::LogLevel::Trace : faketime::LogLevel::Off;
    faketime::Scheduler sched(cfg);

    FlakyEndpoint endpoint(p.failures);
    Connector connector(endpoint, p, sched.get_clock(faketime::Instant{}));

    sched.run([&](faketime::Scheduler &)
              { connector.start(); });

    // Nothing has run yet: the first attempt is a pending microtask.
    std::cout << "pending microtasks=" << sched.microtask_count()
              << " timers=" << sched.non_periodic_timer_count() << "\n";

    sched.flush_timers();

    const auto s = sched.stats();
    std::cout << "final state="
              << (connector.state() == Connector::State::Connected ? "connected" : "gave-up")
              << " virtual_elapsed_ms=" << std::chrono::duration_cast<std::chrono::milliseconds>(s.elapsed).count()
              << " timers_fired=" << s.timersFired
              << " timers_cancelled=" << s.timersCancelled << "\n";
    return connector.state() == Connector::State::Connected ? 0 : 1;
}
