#pragma once

// Small deterministic models shared by the controller tests.

#include "common.hpp"

#include <cmath>
#include <cstdint>
#include <functional>

namespace tickback_test
{
    struct CubeInput
    {
        std::int32_t dx = 0;
        std::int32_t dy = 0;
    };

    struct CubeState
    {
        double x = 0.0;
        double y = 0.0;
    };

    // A cube moved by a directional input. The server can push it (knockback), which the
    // owner cannot predict and must learn through a correction.
    class CubeModel
    {
    public:
        using Input = CubeInput;
        using State = CubeState;

        // Input for the n-th gather_input() call.
        std::function<CubeInput(std::uint64_t)> script;

        double speed = 6.0;
        double tolerance = 1e-6;

        // Added once to x on the next live (non-replay) simulate.
        double pendingPushX = 0.0;

        // Called at the end of every replayed simulate.
        std::function<void()> onReplay;

        CubeState state{};

        std::uint64_t gathered = 0;
        std::uint64_t liveSteps = 0;
        std::uint64_t replaySteps = 0;
        std::uint64_t applied = 0;

        CubeInput gather_input()
        {
            CubeInput in{};
            if (script)
            {
                in = script(gathered);
            }
            ++gathered;
            return in;
        }

        CubeState gather_state() const { return state; }

        void simulate(const CubeInput &in, double dt, bool replay)
        {
            state.x += static_cast<double>(in.dx) * speed * dt;
            state.y += static_cast<double>(in.dy) * speed * dt;
            if (replay)
            {
                ++replaySteps;
                if (onReplay)
                {
                    onReplay();
                }
                return;
            }
            state.x += pendingPushX;
            pendingPushX = 0.0;
            ++liveSteps;
        }

        bool tolerant_equals(const CubeState &a, const CubeState &b) const
        {
            return std::fabs(a.x - b.x) <= tolerance && std::fabs(a.y - b.y) <= tolerance;
        }

        void apply_state(const CubeState &s)
        {
            state = s;
            ++applied;
        }
    };

    struct ObstacleState
    {
        double x = 0.0;
        double dir = 1.0;
    };

    // An input-less obstacle bouncing between two walls.
    class ObstacleModel
    {
    public:
        using State = ObstacleState;

        double speed = 3.0;
        double minX = -5.0;
        double maxX = 5.0;
        double tolerance = 1e-6;

        ObstacleState state{};
        std::uint64_t replaySteps = 0;

        // Called before every replayed step.
        std::function<void()> onReplay;

        ObstacleState gather_state() const { return state; }

        void simulate(double dt, bool replay)
        {
            if (replay && onReplay)
            {
                onReplay();
            }
            state.x += state.dir * speed * dt;
            if (state.x > maxX)
            {
                state.x = maxX;
                state.dir = -1.0;
            }
            else if (state.x < minX)
            {
                state.x = minX;
                state.dir = 1.0;
            }
            if (replay)
            {
                ++replaySteps;
            }
        }

        bool tolerant_equals(const ObstacleState &a, const ObstacleState &b) const
        {
            return std::fabs(a.x - b.x) <= tolerance && a.dir == b.dir;
        }

        void apply_state(const ObstacleState &s) { state = s; }
    };
}
