#pragma once

#include "catch_up.hpp"
#include "log.hpp"
#include "wire.hpp"

#include <stdexcept>

namespace tickback
{
    enum class Role : std::uint8_t
    {
        // Neither predicting nor authoritative (e.g. a remote player's entity on a client).
        Observer = 0,
        // The predicting client that produces inputs for this entity.
        Owner = 1,
        // The server that simulates from buffered inputs and issues corrections.
        Authority = 2,
    };

    inline const char *role_name(Role r) noexcept
    {
        switch (r)
        {
        case Role::Observer:
            return "observer";
        case Role::Owner:
            return "owner";
        case Role::Authority:
            return "authority";
        }
        return "unknown";
    }

    struct ControllerConfig
    {
        EntityId entity = 0;

        Role role = Role::Observer;

        // This process's peer id (used for logging and as the message source).
        PeerId self = 0;

        // Where the owner sends its inputs.
        PeerId serverPeer = ServerPeer;

        // Where the authority sends corrections for this entity.
        PeerId ownerPeer = 1;

        // Soft bound of the input and state histories (0 = unbounded).
        std::size_t historyCapacity = 1024;

        CatchUpPolicy catchUp{};

        // Fixed simulation step handed to Model::simulate.
        double tickDelta = 1.0 / 60.0;

        // Scratch capacity for a single marshalled payload.
        std::size_t payloadCapacity = DefaultPayloadCapacity;

        // Applied to the process-wide Logger on construction unless Off.
        LogLevel logLevel = LogLevel::Off;
    };

    inline void validate_controller_config(const ControllerConfig &cfg)
    {
        validate_catch_up_policy(cfg.catchUp);
        if (!(cfg.tickDelta > 0.0))
        {
            throw std::invalid_argument("ControllerConfig: tickDelta must be positive");
        }
        if (cfg.payloadCapacity == 0)
        {
            throw std::invalid_argument("ControllerConfig: payloadCapacity must be non-zero");
        }
    }
}
