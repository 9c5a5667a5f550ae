#pragma once

#include "common.hpp"
#include "history.hpp"
#include "payload.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace tickback
{
    // A commutative, multiplicity-sensitive digest of recorded states.
    //
    // Two peers (or two runs) that recorded the same (entity, tick, state) entries produce
    // the same digest regardless of the order the entities were visited in. Each entry
    // contributes a 64-bit hash combined via both SUM and XOR.
    struct StateDigest
    {
        std::uint64_t entries = 0;
        std::uint64_t stateSum = 0;
        std::uint64_t stateXor = 0;

        bool operator==(const StateDigest &o) const noexcept
        {
            return entries == o.entries && stateSum == o.stateSum && stateXor == o.stateXor;
        }
        bool operator!=(const StateDigest &o) const noexcept { return !(*this == o); }
    };

    namespace detail
    {
        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes) noexcept
        {
            std::uint64_t h = 1469598103934665603ULL;
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        template <class T>
        inline void append_trivial(std::vector<std::byte> &out, const T &v)
        {
            static_assert(std::is_trivially_copyable_v<T>);
            const std::size_t off = out.size();
            out.resize(off + sizeof(T));
            std::memcpy(out.data() + off, &v, sizeof(T));
        }

        template <class State>
        inline std::uint64_t hash_recorded_state(EntityId entity, Tick tick, const State &state)
        {
            const ByteBuffer encoded = PayloadCodec<State>::encode(state);
            std::vector<std::byte> buf;
            buf.reserve(sizeof(entity) + sizeof(tick) + encoded.size());
            append_trivial(buf, entity);
            append_trivial(buf, tick);
            buf.insert(buf.end(), encoded.begin(), encoded.end());
            return fnv1a64(std::span<const std::byte>(buf.data(), buf.size()));
        }
    }

    class DeterminismAccumulator
    {
    public:
        template <class State>
        void on_recorded_state(EntityId entity, Tick tick, const State &state)
        {
            const std::uint64_t h = detail::hash_recorded_state(entity, tick, state);
            ++m_digest.entries;
            m_digest.stateSum += h;
            m_digest.stateXor ^= h;
        }

        // Folds every entry of `history`, optionally restricted to ticks in [from, to].
        template <class State>
        void on_history(EntityId entity, const History<State> &history, Tick from = 0, Tick to = ~Tick{0})
        {
            for (std::size_t i = 0; i < history.size(); ++i)
            {
                const Tick t = history.entry_tick(i);
                if (t < from || t > to)
                {
                    continue;
                }
                on_recorded_state(entity, t, history[i]);
            }
        }

        const StateDigest &digest() const noexcept { return m_digest; }

    private:
        StateDigest m_digest{};
    };

    template <class State>
    inline StateDigest history_digest(EntityId entity, const History<State> &history, Tick from = 0, Tick to = ~Tick{0})
    {
        DeterminismAccumulator acc;
        acc.on_history(entity, history, from, to);
        return acc.digest();
    }
}
