#pragma once

#include "config.hpp"
#include "transport.hpp"

namespace tickback
{
    // Type-erased view of a per-entity controller, used by the registry and the session
    // driver to handle heterogeneous entity kinds together.
    class IController
    {
    public:
        virtual ~IController() = default;

        virtual EntityId entity() const noexcept = 0;
        virtual Role role() const noexcept = 0;

        // Pre-tick: gather/simulate/record for this frame.
        virtual void on_tick(Tick localTick) = 0;

        // Post-tick: gather state, record, transmit.
        virtual void on_post_tick(Tick localTick) = 0;

        // Handles a message addressed to this entity. Returns true if it was accepted.
        virtual bool receive(const WireMessage &msg) = 0;

        // Snaps the live simulation to the recorded state at `tick`. History is left
        // untouched. Returns false if no state is recorded for `tick`.
        virtual bool rollback_to(Tick tick) = 0;

        // Snaps the live simulation to the most recent recorded state.
        virtual bool reset_state() = 0;
    };
}
