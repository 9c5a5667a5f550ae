#pragma once

#include "common.hpp"

#include <cstdint>

namespace tickback
{
    // Stateless deterministic RNG.
    //
    // Every draw is a pure function of (seed, stream, key, draw), so a lossy link or a
    // randomized workload replays identically given the same seed. Keys are usually a
    // tick or a message counter.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    inline std::uint64_t rng_u64(std::uint64_t seed,
                                 std::uint32_t stream,
                                 std::uint64_t key,
                                 std::uint32_t draw = 0) noexcept
    {
        std::uint64_t x = seed;
        x = mix_u64(x, static_cast<std::uint64_t>(stream));
        x = mix_u64(x, key);
        x = mix_u64(x, static_cast<std::uint64_t>(draw));
        return splitmix64(x);
    }

    // Uniform in [0,1).
    inline double rng_unit_double(std::uint64_t seed,
                                  std::uint32_t stream,
                                  std::uint64_t key,
                                  std::uint32_t draw = 0) noexcept
    {
        const std::uint64_t mantissa = rng_u64(seed, stream, key, draw) >> 11; // 53 bits
        return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0);  // 2^53
    }

    // Uniform integer in [lo, hi] (inclusive). Undefined if lo > hi.
    inline std::uint64_t rng_u64_range(std::uint64_t seed,
                                       std::uint32_t stream,
                                       std::uint64_t key,
                                       std::uint64_t lo,
                                       std::uint64_t hi,
                                       std::uint32_t draw = 0) noexcept
    {
        const std::uint64_t span = (hi - lo) + 1;
        return lo + (rng_u64(seed, stream, key, draw) % span);
    }
}
