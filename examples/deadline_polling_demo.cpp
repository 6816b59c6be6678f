#include "host_runtime.hpp"
#include "scheduler.hpp"

#include <iostream>
#include <string>

namespace
{
    using namespace std::chrono_literals;

    // Remote job whose status flips to done after a fixed amount of virtual time.
    class RemoteJob
    {
    public:
        RemoteJob(faketime::Scheduler &sched, faketime::Duration runtime) : m_sched(sched), m_doneAt(sched.elapsed() + runtime) {}

        // Each status query blocks for a round trip.
        bool is_done() const
        {
            m_sched.elapse_blocking(20ms);
            return m_sched.elapsed() >= m_doneAt;
        }

    private:
        faketime::Scheduler &m_sched;
        faketime::Duration m_doneAt;
    };

    // Application code: polls every `interval` until done or until `timeout` passes.
    class Poller
    {
    public:
        explicit Poller(const RemoteJob &job) : m_job(job) {}

        void start(faketime::Duration interval, faketime::Duration timeout)
        {
            m_poll = host::set_interval(interval, [this](faketime::TimerHandle self)
                                        {
                ++m_polls;
                if (m_job.is_done())
                {
                    self.cancel();
                    m_timeout.cancel();
                    host::post([this]
                               { m_outcome = "done after " + std::to_string(m_polls) + " polls"; });
                } });
            m_timeout = host::set_timeout(timeout, [this]
                                          {
                m_poll.cancel();
                m_outcome = "timed out after " + std::to_string(m_polls) + " polls"; });
        }

        const std::string &outcome() const noexcept { return m_outcome; }

    private:
        const RemoteJob &m_job;
        faketime::TimerHandle m_poll;
        faketime::TimerHandle m_timeout;
        int m_polls = 0;
        std::string m_outcome = "pending";
    };

    void run_case(const char *name, faketime::Duration jobRuntime)
    {
        faketime::Scheduler sched;
        RemoteJob job(sched, jobRuntime);
        Poller poller(job);

        sched.run([&](faketime::Scheduler &)
                  { poller.start(250ms, 5s); });

        // Step in coarse increments, the way a test would assert progress.
        while (sched.periodic_timer_count() + sched.non_periodic_timer_count() > 0)
        {
            sched.elapse(1s);
            std::cout << name << ": t=" << std::chrono::duration_cast<std::chrono::milliseconds>(sched.elapsed()).count()
                      << "ms outcome=" << poller.outcome() << "\n";
        }
    }
}

int main()
{
    run_case("fast-job", 1200ms);
    run_case("slow-job", 60s);
    return 0;
}
