#pragma once

#include "timer.hpp"

#include <map>
#include <set>
#include <utility>

namespace faketime
{
    // Live set of pending timers. Membership is the only notion of "active".
    //
    // Entries live in an id-keyed map; a separate (nextFire, id) index answers
    // earliest() in O(log n). Ids grow with creation order, so timers sharing a
    // nextFire come out in the order they were created.
    class TimerRegistry
    {
    public:
        struct Totals
        {
            std::uint64_t oneShotCreated = 0;
            std::uint64_t periodicCreated = 0;
            std::uint64_t cancelled = 0;
        };

        TimerId insert(Duration nextFire, TimerKind kind)
        {
            const TimerId id = m_nextId++;

            TimerEntry entry;
            entry.id = id;
            entry.nextFire = nextFire;
            entry.kind = std::make_shared<TimerKind>(std::move(kind));

            if (entry.is_periodic())
            {
                ++m_periodic;
                ++m_totals.periodicCreated;
            }
            else
            {
                ++m_totals.oneShotCreated;
            }

            m_schedule.emplace(nextFire, id);
            m_entries.emplace(id, std::move(entry));
            return id;
        }

        // Returns false if the id was not registered.
        bool remove(TimerId id)
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end())
            {
                return false;
            }
            if (it->second.is_periodic())
            {
                --m_periodic;
            }
            m_schedule.erase(std::make_pair(it->second.nextFire, id));
            m_entries.erase(it);
            return true;
        }

        // remove() issued on behalf of the application rather than the firing loop.
        bool cancel(TimerId id)
        {
            if (!remove(id))
            {
                return false;
            }
            ++m_totals.cancelled;
            return true;
        }

        bool contains(TimerId id) const
        {
            return m_entries.count(id) != 0;
        }

        const TimerEntry *find(TimerId id) const
        {
            auto it = m_entries.find(id);
            return it == m_entries.end() ? nullptr : &it->second;
        }

        // Smallest nextFire; ties go to the lowest id. nullptr when empty.
        const TimerEntry *earliest() const
        {
            if (m_schedule.empty())
            {
                return nullptr;
            }
            return find(m_schedule.begin()->second);
        }

        void reschedule(TimerId id, Duration nextFire)
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end())
            {
                return;
            }
            m_schedule.erase(std::make_pair(it->second.nextFire, id));
            it->second.nextFire = nextFire;
            m_schedule.emplace(nextFire, id);
        }

        template <class Pred>
        bool any_of(Pred &&pred) const
        {
            for (const auto &[id, entry] : m_entries)
            {
                (void)id;
                if (pred(entry))
                {
                    return true;
                }
            }
            return false;
        }

        bool empty() const noexcept { return m_entries.empty(); }

        std::size_t size() const noexcept { return m_entries.size(); }

        std::size_t periodic_count() const noexcept { return m_periodic; }

        std::size_t non_periodic_count() const noexcept { return m_entries.size() - m_periodic; }

        const Totals &totals() const noexcept { return m_totals; }

        // Used by invariant checks: the index must mirror the entries exactly.
        bool index_consistent() const
        {
            if (m_schedule.size() != m_entries.size())
            {
                return false;
            }
            std::size_t periodic = 0;
            for (const auto &[id, entry] : m_entries)
            {
                if (entry.id != id || m_schedule.count(std::make_pair(entry.nextFire, id)) == 0)
                {
                    return false;
                }
                if (entry.is_periodic())
                {
                    ++periodic;
                }
            }
            return periodic == m_periodic;
        }

    private:
        std::map<TimerId, TimerEntry> m_entries;
        std::set<std::pair<Duration, TimerId>> m_schedule;
        std::size_t m_periodic = 0;
        TimerId m_nextId = 1;
        Totals m_totals{};
    };

    inline void TimerHandle::cancel() const
    {
        if (m_registry)
        {
            m_registry->cancel(m_id);
        }
    }

    inline bool TimerHandle::is_active() const
    {
        return m_registry != nullptr && m_registry->contains(m_id);
    }
}
