#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tickback
{
    using Tick = std::uint64_t;

    using PeerId = std::uint32_t;
    using EntityId = std::uint64_t;

    using ByteBuffer = std::vector<std::byte>;

    // Peer id conventionally used by the authoritative server.
    inline constexpr PeerId ServerPeer = 0;

    template <class T>
    inline ByteBuffer bytes_from_trivially_copyable(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        ByteBuffer out(sizeof(T));
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }

    // Returns false (and leaves `out` untouched) if the size does not match.
    template <class T>
    inline bool trivially_copyable_from_bytes(std::span<const std::byte> bytes, T &out)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        if (bytes.size() != sizeof(T))
        {
            return false;
        }
        std::memcpy(&out, bytes.data(), sizeof(T));
        return true;
    }
}
