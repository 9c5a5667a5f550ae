#pragma once

#include "common.hpp"

namespace tickback
{
    // Tick-ordered buffer of snapshots (inputs or states) for one stream.
    //
    // Entries are kept sorted by tick in a contiguous vector, one entry per tick.
    // With a non-zero capacity the buffer is soft-bounded: it grows past `capacity`
    // until it reaches cut_threshold(), then drops the oldest entries in one go so
    // exactly `capacity` remain. Capacity 0 means unbounded.
    template <class T>
    class History
    {
    public:
        static_assert(std::is_copy_constructible_v<T> && std::is_default_constructible_v<T>,
                      "History<T> requires a copyable, default-constructible T");

        static constexpr std::size_t Unbounded = 0;

        explicit History(std::size_t capacity = Unbounded) : m_capacity(capacity)
        {
            if (m_capacity > 0)
            {
                m_cutThreshold = std::max(m_capacity + 10, m_capacity + m_capacity / 2);
                m_entries.reserve(m_capacity);
            }
        }

        std::size_t size() const noexcept { return m_entries.size(); }
        bool empty() const noexcept { return m_entries.empty(); }
        std::size_t capacity() const noexcept { return m_capacity; }

        // Size at which pruning kicks in (0 when unbounded).
        std::size_t cut_threshold() const noexcept { return m_cutThreshold; }

        Tick most_recent_tick() const noexcept
        {
            return m_entries.empty() ? Tick{0} : m_entries.back().tick;
        }

        Tick oldest_tick() const noexcept
        {
            return m_entries.empty() ? Tick{0} : m_entries.front().tick;
        }

        Tick entry_tick(std::size_t index) const { return m_entries[index].tick; }

        // Raw access by position. Indices come from find() and are only valid until
        // the next mutation.
        T &operator[](std::size_t index) { return m_entries[index].data; }
        const T &operator[](std::size_t index) const { return m_entries[index].data; }

        void write(Tick tick, T data)
        {
            std::size_t index = 0;
            if (find(tick, index))
            {
                m_entries[index].data = std::move(data);
                return;
            }

            m_entries.insert(m_entries.begin() + static_cast<std::ptrdiff_t>(index), Entry{tick, std::move(data)});

            if (m_capacity > 0)
            {
                downsize_();
            }
        }

        // On a miss `out` is reset to T{}.
        bool read(Tick tick, T &out) const
        {
            std::size_t index = 0;
            if (!find(tick, index))
            {
                out = T{};
                return false;
            }
            out = m_entries[index].data;
            return true;
        }

        bool contains(Tick tick) const
        {
            std::size_t index = 0;
            return find(tick, index);
        }

        // Binary search. On a hit `index` is the entry position; on a miss it is the
        // insertion position (every entry before it has a smaller tick).
        bool find(Tick tick, std::size_t &index) const
        {
            auto it = std::lower_bound(m_entries.begin(), m_entries.end(), tick,
                                       [](const Entry &e, Tick t)
                                       { return e.tick < t; });
            index = static_cast<std::size_t>(it - m_entries.begin());
            return it != m_entries.end() && it->tick == tick;
        }

        // Drop everything before `tick` (and `tick` itself if inclusive).
        void clear_past(Tick tick, bool inclusive = false)
        {
            std::size_t index = 0;
            if (find(tick, index) && inclusive)
            {
                ++index;
            }
            m_entries.erase(m_entries.begin(), m_entries.begin() + static_cast<std::ptrdiff_t>(index));
        }

        // Drop everything after `tick` (and `tick` itself if inclusive).
        void clear_future(Tick tick, bool inclusive = false)
        {
            std::size_t index = 0;
            if (find(tick, index) && !inclusive)
            {
                ++index;
            }
            m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(index), m_entries.end());
        }

        void clear() { m_entries.clear(); }

        void shrink_to_fit() { m_entries.shrink_to_fit(); }

    private:
        struct Entry
        {
            Tick tick = 0;
            T data{};
        };

        void downsize_()
        {
            if (m_entries.size() < m_cutThreshold)
            {
                return;
            }
            const std::size_t toRemove = m_entries.size() - m_capacity;
            m_entries.erase(m_entries.begin(), m_entries.begin() + static_cast<std::ptrdiff_t>(toRemove));
        }

        std::size_t m_capacity = Unbounded;
        std::size_t m_cutThreshold = 0;
        std::vector<Entry> m_entries;
    };
}
