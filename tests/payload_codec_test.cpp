/*
Purpose: Tests payload marshalling.

What this tests: Submissions and corrections survive encoding, a user PayloadCodec
specialization is picked up for a non-trivially-copyable state, payloads larger than the
scratch capacity fail with std::length_error, and truncated, mis-sized or over-long
buffers are rejected by throwing instead of decoding garbage.
*/

#include "payload.hpp"

#include <array>
#include <cassert>
#include <stdexcept>
#include <string>

namespace
{
    struct Input
    {
        std::int32_t dx = 0;
        std::uint8_t fire = 0;
    };

    struct State
    {
        double x = 0.0;
        double y = 0.0;
    };

    struct BigState
    {
        std::array<std::byte, 2000> blob{};
    };

    // Variable-size state with a user-provided codec.
    struct Tagged
    {
        std::string name;
        std::uint32_t hp = 0;
    };

    template <typename Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }
}

namespace tickback
{
    template <>
    struct PayloadCodec<Tagged>
    {
        static ByteBuffer encode(const Tagged &t)
        {
            WireWriter w(256);
            w.write_u32(t.hp);
            w.write_bytes(std::span<const std::byte>(reinterpret_cast<const std::byte *>(t.name.data()), t.name.size()));
            return w.take();
        }

        static bool decode(std::span<const std::byte> bytes, Tagged &out)
        {
            WireReader r(bytes);
            out.hp = r.read_u32();
            const auto name = r.read_bytes();
            out.name.assign(reinterpret_cast<const char *>(name.data()), name.size());
            return r.eof();
        }
    };
}

int main()
{
    // Submission.
    {
        tickback::InputSubmission<Input, State> sub;
        sub.tick = 123456789012ULL;
        sub.input = Input{-3, 1};
        sub.state = State{1.5, -2.25};

        const auto bytes = tickback::encode_input_submission(sub);
        const auto back = tickback::decode_input_submission<Input, State>(std::span<const std::byte>(bytes.data(), bytes.size()));
        assert(back.tick == sub.tick);
        assert(back.input.dx == -3 && back.input.fire == 1);
        assert(back.state.x == 1.5 && back.state.y == -2.25);
    }

    // Custom codec.
    {
        const tickback::TickState<Tagged> ts{42, Tagged{"crate", 7}};
        const auto bytes = tickback::encode_tick_state(ts);
        const auto back = tickback::decode_tick_state<Tagged>(std::span<const std::byte>(bytes.data(), bytes.size()));
        assert(back.tick == 42);
        assert(back.state.name == "crate");
        assert(back.state.hp == 7);
    }

    // Scratch capacity.
    {
        bool threw = false;
        try
        {
            (void)tickback::encode_tick_state(tickback::TickState<BigState>{});
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            (void)tickback::encode_tick_state(tickback::TickState<State>{1, State{}}, /*capacity=*/16);
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto big = tickback::encode_tick_state(tickback::TickState<BigState>{}, /*capacity=*/4096);
        assert(big.size() == 8 + 4 + sizeof(BigState));
    }

    // Truncated buffers.
    {
        expect_throw([]
                     { (void)tickback::decode_tick_state<State>({}); });

        auto bytes = tickback::encode_tick_state(tickback::TickState<State>{9, State{1.0, 2.0}});
        bytes.resize(bytes.size() - 1);
        expect_throw([&]
                     { (void)tickback::decode_tick_state<State>(std::span<const std::byte>(bytes.data(), bytes.size())); });

        auto sub = tickback::encode_input_submission(tickback::InputSubmission<Input, State>{});
        sub.resize(10);
        expect_throw([&]
                     { (void)tickback::decode_input_submission<Input, State>(std::span<const std::byte>(sub.data(), sub.size())); });
    }

    // Well-framed but wrong size for the type.
    {
        const auto bytes = tickback::encode_tick_state(tickback::TickState<Input>{9, Input{}});
        expect_throw([&]
                     { (void)tickback::decode_tick_state<State>(std::span<const std::byte>(bytes.data(), bytes.size())); });
    }

    // Trailing bytes.
    {
        auto bytes = tickback::encode_tick_state(tickback::TickState<State>{9, State{}});
        bytes.push_back(std::byte{0});
        expect_throw([&]
                     { (void)tickback::decode_tick_state<State>(std::span<const std::byte>(bytes.data(), bytes.size())); });
    }

    // A correction sent as a submission does not decode as one.
    {
        const auto bytes = tickback::encode_tick_state(tickback::TickState<State>{9, State{}});
        expect_throw([&]
                     { (void)tickback::decode_input_submission<Input, State>(std::span<const std::byte>(bytes.data(), bytes.size())); });
    }

    return 0;
}
