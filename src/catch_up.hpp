#pragma once

#include "history.hpp"

#include <stdexcept>

namespace tickback
{
    // Bounds how far the authority's cursor may lag behind the inputs a client has
    // already submitted.
    struct CatchUpPolicy
    {
        // Do not step until at least this many inputs are buffered at or ahead of the
        // cursor. Absorbs jitter and out-of-order arrival at the cost of added delay.
        std::size_t minBuffer = 5;

        // If more than this many inputs are buffered at or ahead of the cursor, jump the
        // cursor forward so only `minBuffer` remain.
        std::size_t maxBuffer = 10;
    };

    inline void validate_catch_up_policy(const CatchUpPolicy &policy)
    {
        if (policy.minBuffer > policy.maxBuffer)
        {
            throw std::invalid_argument("CatchUpPolicy: minBuffer must not exceed maxBuffer");
        }
    }

    enum class ServerStepKind : std::uint8_t
    {
        // Fewer than minBuffer inputs at or ahead of the cursor; cursor stays.
        Idle = 0,
        // The cursor tick has not arrived and nothing newer has either; cursor stays.
        Stall = 1,
        // Input present at `tick`.
        Simulate = 2,
        // Input missing at `tick` but newer ones exist: treat as lost, simulate a default input.
        SimulateDropped = 3,
    };

    struct ServerStepPlan
    {
        ServerStepKind kind = ServerStepKind::Idle;

        // Tick to simulate (or to stall on). Differs from the cursor passed in only after a
        // catch-up jump.
        Tick tick = 0;

        // Ticks jumped over by catch-up (0 if no jump happened).
        Tick skippedTicks = 0;
    };

    // Decides what the authority does with its cursor this tick. Pure; the caller applies it.
    template <class Input>
    inline ServerStepPlan plan_server_step(const History<Input> &inputs, Tick cursor, const CatchUpPolicy &policy)
    {
        ServerStepPlan plan;
        plan.tick = cursor;

        if (inputs.empty())
        {
            plan.kind = ServerStepKind::Idle;
            return plan;
        }

        // Entries at or ahead of the cursor; an absent cursor yields its insertion index.
        std::size_t index = 0;
        const bool present = inputs.find(cursor, index);
        const std::size_t ahead = inputs.size() - index;
        if (ahead == 0)
        {
            plan.kind = ServerStepKind::Stall;
            return plan;
        }
        if (ahead < policy.minBuffer)
        {
            plan.kind = ServerStepKind::Idle;
            return plan;
        }

        if (present && ahead > policy.maxBuffer)
        {
            std::size_t target = inputs.size() - policy.minBuffer;
            if (target >= inputs.size())
            {
                target = inputs.size() - 1;
            }
            if (target > index)
            {
                plan.tick = inputs.entry_tick(target);
                plan.skippedTicks = plan.tick - cursor;
            }
        }

        // Something newer than the cursor is buffered, so a missing cursor tick is lost.
        plan.kind = inputs.contains(plan.tick) ? ServerStepKind::Simulate : ServerStepKind::SimulateDropped;
        return plan;
    }
}
