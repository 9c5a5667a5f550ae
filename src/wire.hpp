#pragma once

#include "common.hpp"

#include <stdexcept>

namespace tickback
{
    // Default scratch capacity for a single marshalled payload.
    inline constexpr std::size_t DefaultPayloadCapacity = 1024;

    // Little-endian writer into a bounded scratch buffer. Exceeding the capacity
    // throws std::length_error instead of silently growing.
    class WireWriter
    {
    public:
        explicit WireWriter(std::size_t capacity = DefaultPayloadCapacity) : m_capacity(capacity)
        {
            m_buf.reserve(capacity);
        }

        std::size_t size() const noexcept { return m_buf.size(); }
        std::size_t capacity() const noexcept { return m_capacity; }

        void write_u8(std::uint8_t v)
        {
            reserve_(1);
            m_buf.push_back(static_cast<std::byte>(v));
        }

        void write_u32(std::uint32_t v)
        {
            reserve_(4);
            for (int i = 0; i < 4; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        void write_u64(std::uint64_t v)
        {
            reserve_(8);
            for (int i = 0; i < 8; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        // Length-prefixed blob.
        void write_bytes(std::span<const std::byte> bytes)
        {
            reserve_(4 + bytes.size());
            write_u32(static_cast<std::uint32_t>(bytes.size()));
            m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
        }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        void reserve_(std::size_t n) const
        {
            if (m_buf.size() + n > m_capacity)
            {
                throw std::length_error("WireWriter: payload exceeds scratch capacity");
            }
        }

        std::size_t m_capacity = DefaultPayloadCapacity;
        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const { return m_pos >= m_bytes.size(); }

        std::uint8_t read_u8()
        {
            require_(1);
            return static_cast<std::uint8_t>(m_bytes[m_pos++]);
        }

        std::uint32_t read_u32()
        {
            require_(4);
            std::uint32_t out = 0;
            for (int i = 0; i < 4; ++i)
            {
                out |= (static_cast<std::uint32_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        std::uint64_t read_u64()
        {
            require_(8);
            std::uint64_t out = 0;
            for (int i = 0; i < 8; ++i)
            {
                out |= (static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        // Returns a view into the underlying buffer; valid as long as that buffer is.
        std::span<const std::byte> read_bytes()
        {
            const auto n = read_u32();
            require_(n);
            auto out = m_bytes.subspan(m_pos, n);
            m_pos += n;
            return out;
        }

    private:
        void require_(std::size_t n) const
        {
            if (n > m_bytes.size() - m_pos)
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
