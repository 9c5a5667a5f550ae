#pragma once

#include "common.hpp"
#include "wire.hpp"

#include <stdexcept>

namespace tickback
{
    // Marshalling capability for input/state types.
    //
    // The primary template handles trivially copyable types by memcpy. Other types
    // must specialize PayloadCodec<T> with the same two static functions.
    template <class T>
    struct PayloadCodec
    {
        static_assert(std::is_trivially_copyable_v<T>,
                      "PayloadCodec<T> must be specialized for non-trivially-copyable types");

        static ByteBuffer encode(const T &value)
        {
            return bytes_from_trivially_copyable(value);
        }

        static bool decode(std::span<const std::byte> bytes, T &out)
        {
            return trivially_copyable_from_bytes(bytes, out);
        }
    };

    // Client -> server: the input used for `tick` and the state it produced locally.
    template <class Input, class State>
    struct InputSubmission
    {
        Tick tick = 0;
        Input input{};
        State state{};
    };

    // A single (tick, state) pair. Used both for server corrections and for
    // observer state reports of shared entities.
    template <class State>
    struct TickState
    {
        Tick tick = 0;
        State state{};
    };

    template <class Input, class State>
    inline ByteBuffer encode_input_submission(const InputSubmission<Input, State> &sub,
                                              std::size_t capacity = DefaultPayloadCapacity)
    {
        const ByteBuffer input = PayloadCodec<Input>::encode(sub.input);
        const ByteBuffer state = PayloadCodec<State>::encode(sub.state);

        WireWriter w(capacity);
        w.write_u64(sub.tick);
        w.write_bytes(std::span<const std::byte>(input.data(), input.size()));
        w.write_bytes(std::span<const std::byte>(state.data(), state.size()));
        return w.take();
    }

    // Throws std::runtime_error on a truncated or mis-sized payload.
    template <class Input, class State>
    inline InputSubmission<Input, State> decode_input_submission(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        InputSubmission<Input, State> sub;
        sub.tick = r.read_u64();
        if (!PayloadCodec<Input>::decode(r.read_bytes(), sub.input))
        {
            throw std::runtime_error("decode_input_submission: bad input payload");
        }
        if (!PayloadCodec<State>::decode(r.read_bytes(), sub.state))
        {
            throw std::runtime_error("decode_input_submission: bad state payload");
        }
        if (!r.eof())
        {
            throw std::runtime_error("decode_input_submission: trailing bytes");
        }
        return sub;
    }

    template <class State>
    inline ByteBuffer encode_tick_state(const TickState<State> &ts,
                                        std::size_t capacity = DefaultPayloadCapacity)
    {
        const ByteBuffer state = PayloadCodec<State>::encode(ts.state);

        WireWriter w(capacity);
        w.write_u64(ts.tick);
        w.write_bytes(std::span<const std::byte>(state.data(), state.size()));
        return w.take();
    }

    template <class State>
    inline TickState<State> decode_tick_state(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        TickState<State> ts;
        ts.tick = r.read_u64();
        if (!PayloadCodec<State>::decode(r.read_bytes(), ts.state))
        {
            throw std::runtime_error("decode_tick_state: bad state payload");
        }
        if (!r.eof())
        {
            throw std::runtime_error("decode_tick_state: trailing bytes");
        }
        return ts;
    }
}
