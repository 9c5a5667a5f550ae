/*
Purpose: Randomized stress test for History against an ordered-map oracle.

What this tests: After any interleaving of writes (in order, out of order, rewrites) and
clears, the history stays sorted and duplicate-free, and every present tick reads back
the last written value. With a capacity, the size never reaches the cut threshold and the
surviving entries are the newest ones.
*/

#include "history.hpp"
#include "random.hpp"

#include <cassert>
#include <cstdint>
#include <map>

namespace
{
    void check_matches(const tickback::History<std::uint64_t> &h, const std::map<tickback::Tick, std::uint64_t> &oracle)
    {
        assert(h.size() == oracle.size());
        std::size_t i = 0;
        for (const auto &[tick, value] : oracle)
        {
            assert(h.entry_tick(i) == tick);
            assert(h[i] == value);
            ++i;
        }
        for (std::size_t j = 1; j < h.size(); ++j)
        {
            assert(h.entry_tick(j - 1) < h.entry_tick(j));
        }
    }

    void run_unbounded(std::uint64_t seed)
    {
        tickback::History<std::uint64_t> h;
        std::map<tickback::Tick, std::uint64_t> oracle;

        for (std::uint64_t op = 0; op < 4000; ++op)
        {
            const std::uint64_t roll = tickback::rng_u64_range(seed, /*stream=*/1, op, 0, 99);
            const tickback::Tick t = tickback::rng_u64_range(seed, /*stream=*/2, op, 0, 500);
            const std::uint64_t value = tickback::rng_u64(seed, /*stream=*/3, op);

            if (roll < 90)
            {
                h.write(t, value);
                oracle[t] = value;
            }
            else if (roll < 95)
            {
                const bool inclusive = (value & 1u) != 0;
                h.clear_past(t, inclusive);
                auto end = inclusive ? oracle.upper_bound(t) : oracle.lower_bound(t);
                oracle.erase(oracle.begin(), end);
            }
            else
            {
                const bool inclusive = (value & 1u) != 0;
                h.clear_future(t, inclusive);
                auto begin = inclusive ? oracle.lower_bound(t) : oracle.upper_bound(t);
                oracle.erase(begin, oracle.end());
            }

            if ((op % 97) == 0)
            {
                check_matches(h, oracle);
            }

            std::uint64_t out = 0;
            const bool present = h.read(t, out);
            auto it = oracle.find(t);
            assert(present == (it != oracle.end()));
            if (present)
            {
                assert(out == it->second);
            }
        }
        check_matches(h, oracle);
    }

    void run_bounded(std::uint64_t seed)
    {
        const std::size_t capacity = 32;
        tickback::History<std::uint64_t> h(capacity);
        std::map<tickback::Tick, std::uint64_t> oracle;

        // Mostly increasing ticks with late arrivals, like a jittery input stream.
        tickback::Tick head = 0;
        for (std::uint64_t op = 0; op < 3000; ++op)
        {
            const std::uint64_t roll = tickback::rng_u64_range(seed, /*stream=*/4, op, 0, 9);
            tickback::Tick t = head;
            if (roll < 2 && head > 4)
            {
                t = head - tickback::rng_u64_range(seed, /*stream=*/5, op, 1, 4);
            }
            else
            {
                ++head;
            }

            // A late tick older than everything kept is still inserted at the front.
            const std::uint64_t value = tickback::rng_u64(seed, /*stream=*/6, op);
            h.write(t, value);
            oracle[t] = value;

            assert(h.size() < h.cut_threshold());
            if (oracle.size() > h.size())
            {
                // Mirror the cut: keep the newest `h.size()` entries.
                while (oracle.size() > h.size())
                {
                    oracle.erase(oracle.begin());
                }
                assert(h.size() == capacity);
            }
            check_matches(h, oracle);
        }
    }
}

int main()
{
    for (std::uint64_t seed = 1; seed <= 5; ++seed)
    {
        run_unbounded(seed);
        run_bounded(seed * 7919);
    }
    return 0;
}
