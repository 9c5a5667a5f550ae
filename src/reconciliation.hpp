#pragma once

#include "history.hpp"

#include <utility>

namespace tickback
{
    // Marks a controller as replaying for the lifetime of the scope, also when the
    // model throws out of a replayed step.
    class ReplayScope
    {
    public:
        explicit ReplayScope(bool &flag) : m_flag(flag) { m_flag = true; }
        ~ReplayScope() { m_flag = false; }

        ReplayScope(const ReplayScope &) = delete;
        ReplayScope &operator=(const ReplayScope &) = delete;

    private:
        bool &m_flag;
    };

    enum class ReconcileOutcome : std::uint8_t
    {
        // Nothing was predicted locally for the corrected tick (pruned or never simulated).
        NoLocalState = 0,
        // The local prediction already agrees with the authoritative state.
        NoDivergence = 1,
        // History was rewritten from the corrected tick and later ticks were replayed.
        Rewound = 2,
    };

    struct ReconcileResult
    {
        ReconcileOutcome outcome = ReconcileOutcome::NoLocalState;

        // Newest predicted tick at the time the correction arrived.
        Tick presentTick = 0;

        std::uint64_t replayedTicks = 0;
        std::uint64_t skippedTicks = 0;
    };

    // Rewrites a predicted state history from an authoritative (tick, state) and replays
    // everything after it.
    //
    // - `diverges(local, authoritative)` is the tolerance check. The correction is only
    //   applied if the local history still disagrees, since it may have been rewritten
    //   after the server compared against it.
    // - `apply(state)` snaps the live simulation to the authoritative state.
    // - `resimulate(t, out)` advances the live simulation by tick `t` in replay mode and
    //   stores the resulting state in `out`. Returning false marks `t` as skipped (no
    //   input available); its stale prediction stays dropped and is not retried.
    // - `onSkip(t)` is informed of every skipped tick.
    //
    // Replay runs for every tick in (tick, presentTick], strictly ascending.
    template <class State, class Diverges, class Apply, class Resimulate, class OnSkip>
    inline ReconcileResult reconcile_history(History<State> &states,
                                             Tick tick,
                                             const State &authoritative,
                                             Diverges &&diverges,
                                             Apply &&apply,
                                             Resimulate &&resimulate,
                                             OnSkip &&onSkip)
    {
        ReconcileResult result;

        State local{};
        if (!states.read(tick, local))
        {
            result.outcome = ReconcileOutcome::NoLocalState;
            return result;
        }
        if (!diverges(local, authoritative))
        {
            result.outcome = ReconcileOutcome::NoDivergence;
            return result;
        }

        result.outcome = ReconcileOutcome::Rewound;
        result.presentTick = states.most_recent_tick();

        states.clear_future(tick, /*inclusive=*/true);
        states.write(tick, authoritative);

        apply(authoritative);

        for (Tick t = tick + 1; t <= result.presentTick; ++t)
        {
            State next{};
            if (!resimulate(t, next))
            {
                ++result.skippedTicks;
                onSkip(t);
                continue;
            }
            states.write(t, std::move(next));
            ++result.replayedTicks;
        }
        return result;
    }

    template <class State, class Diverges, class Apply, class Resimulate>
    inline ReconcileResult reconcile_history(History<State> &states,
                                             Tick tick,
                                             const State &authoritative,
                                             Diverges &&diverges,
                                             Apply &&apply,
                                             Resimulate &&resimulate)
    {
        return reconcile_history(states, tick, authoritative,
                                 std::forward<Diverges>(diverges),
                                 std::forward<Apply>(apply),
                                 std::forward<Resimulate>(resimulate),
                                 [](Tick) {});
    }
}
