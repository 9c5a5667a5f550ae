/*
Purpose: Tests the authority's catch-up planning.

What this tests: plan_server_step() idles until minBuffer inputs are buffered at or ahead
of the cursor (however many older ones the server already consumed), simulates a present tick, stalls on a tick that has not arrived, treats a hole behind newer inputs as
a dropped packet, and jumps the cursor forward when more than maxBuffer inputs are queued
at or ahead of it.
*/

#include "catch_up.hpp"

#include <cassert>
#include <stdexcept>

namespace
{
    tickback::History<int> inputs_for(std::initializer_list<tickback::Tick> ticks)
    {
        tickback::History<int> h;
        for (const tickback::Tick t : ticks)
        {
            h.write(t, static_cast<int>(t));
        }
        return h;
    }
}

int main()
{
    using tickback::ServerStepKind;

    const tickback::CatchUpPolicy policy{.minBuffer = 3, .maxBuffer = 5};

    // Idle below minBuffer.
    {
        auto empty = inputs_for({});
        assert(tickback::plan_server_step(empty, 0, policy).kind == ServerStepKind::Idle);

        auto two = inputs_for({10, 11});
        auto plan = tickback::plan_server_step(two, 10, policy);
        assert(plan.kind == ServerStepKind::Idle);
        assert(plan.tick == 10);
    }

    // Present tick.
    {
        auto h = inputs_for({10, 11, 12});
        auto plan = tickback::plan_server_step(h, 10, policy);
        assert(plan.kind == ServerStepKind::Simulate);
        assert(plan.tick == 10);
        assert(plan.skippedTicks == 0);
    }

    // Cursor ahead of everything received: wait.
    {
        auto h = inputs_for({10, 11, 12});
        auto plan = tickback::plan_server_step(h, 13, policy);
        assert(plan.kind == ServerStepKind::Stall);
        assert(plan.tick == 13);
    }

    // Hole with newer inputs behind it: dropped.
    {
        auto h = inputs_for({10, 12, 13, 14});
        auto plan = tickback::plan_server_step(h, 11, policy);
        assert(plan.kind == ServerStepKind::SimulateDropped);
        assert(plan.tick == 11);

        // Only two inputs past the hole: keep waiting instead.
        auto shortQueue = inputs_for({10, 12, 13});
        assert(tickback::plan_server_step(shortQueue, 11, policy).kind == ServerStepKind::Idle);
    }

    // A warm server with a long consumed history still waits for minBuffer inputs ahead.
    {
        auto h = inputs_for({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        assert(tickback::plan_server_step(h, 8, policy).kind == ServerStepKind::Simulate);

        auto plan = tickback::plan_server_step(h, 9, policy);
        assert(plan.kind == ServerStepKind::Idle);
        assert(plan.tick == 9);
        assert(tickback::plan_server_step(h, 10, policy).kind == ServerStepKind::Idle);

        h.write(11, 11);
        assert(tickback::plan_server_step(h, 9, policy).kind == ServerStepKind::Simulate);
    }

    // Without a buffer requirement a single input ahead is enough.
    {
        const tickback::CatchUpPolicy eager{.minBuffer = 0, .maxBuffer = 5};
        auto h = inputs_for({1, 2, 3});
        assert(tickback::plan_server_step(h, 3, eager).kind == ServerStepKind::Simulate);
        assert(tickback::plan_server_step(h, 4, eager).kind == ServerStepKind::Stall);
    }

    // Exactly maxBuffer queued at or ahead of the cursor: no jump.
    {
        auto h = inputs_for({10, 11, 12, 13, 14});
        auto plan = tickback::plan_server_step(h, 10, policy);
        assert(plan.kind == ServerStepKind::Simulate);
        assert(plan.skippedTicks == 0);
    }

    // More than maxBuffer: jump so that minBuffer remain from the new cursor.
    {
        auto h = inputs_for({10, 11, 12, 13, 14, 15, 16, 17});
        auto plan = tickback::plan_server_step(h, 10, policy);
        assert(plan.kind == ServerStepKind::Simulate);
        assert(plan.tick == 15);
        assert(plan.skippedTicks == 5);
    }

    // Jump target found by position, so gaps in the ticks are jumped over as well.
    {
        auto h = inputs_for({10, 11, 12, 20, 21, 22, 30, 31});
        auto plan = tickback::plan_server_step(h, 10, policy);
        assert(plan.kind == ServerStepKind::Simulate);
        assert(plan.tick == 22);
        assert(plan.skippedTicks == 12);
    }

    // Inputs older than the cursor are already consumed and do not count towards the lag.
    {
        auto h = inputs_for({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        auto plan = tickback::plan_server_step(h, 8, policy);
        assert(plan.kind == ServerStepKind::Simulate);
        assert(plan.tick == 8);
        assert(plan.skippedTicks == 0);
    }

    // Cursor not buffered: no jump, even with a long queue.
    {
        auto h = inputs_for({10, 11, 12, 13, 14, 15, 16, 17, 18});
        auto plan = tickback::plan_server_step(h, 9, policy);
        assert(plan.kind == ServerStepKind::SimulateDropped);
        assert(plan.skippedTicks == 0);
    }

    // Policy validation.
    {
        bool threw = false;
        try
        {
            tickback::validate_catch_up_policy(tickback::CatchUpPolicy{.minBuffer = 6, .maxBuffer = 5});
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        tickback::validate_catch_up_policy(tickback::CatchUpPolicy{});
        tickback::validate_catch_up_policy(tickback::CatchUpPolicy{.minBuffer = 0, .maxBuffer = 0});
    }

    return 0;
}
