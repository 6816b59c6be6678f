#include "microtask_queue.hpp"

#include <cassert>
#include <stdexcept>
#include <vector>

namespace
{
    template <class E, class Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const E &)
        {
            threw = true;
        }
        assert(threw);
    }
}

int main()
{
    // Insertion order is execution order.
    {
        faketime::MicrotaskQueue q;
        std::vector<int> order;
        q.enqueue([&]
                  { order.push_back(1); });
        q.enqueue([&]
                  { order.push_back(2); });
        q.enqueue([&]
                  { order.push_back(3); });
        assert(q.size() == 3);

        const std::size_t ran = q.drain_all();
        assert(ran == 3);
        assert((order == std::vector<int>{1, 2, 3}));
        assert(q.empty());
    }

    // Work enqueued while draining runs before drain_all returns, after what was
    // already queued.
    {
        faketime::MicrotaskQueue q;
        std::vector<int> order;
        q.enqueue([&]
                  {
            order.push_back(1);
            q.enqueue([&]
                      {
                order.push_back(3);
                q.enqueue([&]
                          { order.push_back(4); }); }); });
        q.enqueue([&]
                  { order.push_back(2); });

        assert(q.drain_all() == 4);
        assert((order == std::vector<int>{1, 2, 3, 4}));
        assert(q.total_run() == 4);
    }

    // A throwing callback leaves the remaining tasks queued.
    {
        faketime::MicrotaskQueue q;
        int later = 0;
        q.enqueue([]
                  { throw std::runtime_error("boom"); });
        q.enqueue([&]
                  { ++later; });

        expect_throw<std::runtime_error>([&]
                                         { q.drain_all(); });
        assert(q.size() == 1);
        assert(later == 0);
        q.drain_all();
        assert(later == 1);
        assert(q.total_run() == 2);
    }

    // Null callbacks are rejected at enqueue time.
    {
        faketime::MicrotaskQueue q;
        expect_throw<faketime::InvalidArgumentError>([&]
                                                     { q.enqueue(faketime::Microtask{}); });
        assert(q.empty());
    }

    return 0;
}
