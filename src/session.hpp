#pragma once

#include "log.hpp"
#include "registry.hpp"
#include "transport.hpp"

#include <memory>
#include <stdexcept>

namespace tickback
{
    struct SessionConfig
    {
        // This process's peer id.
        PeerId self = 0;

        // First local tick handed to controllers.
        Tick startTick = 0;

        // Upper bound on messages routed per step (0 = drain everything pending).
        std::size_t maxMessagesPerStep = 0;

        LogLevel logLevel = LogLevel::Off;
    };

    // Fixed-tick driver for one peer.
    //
    // Each step() is one logical frame: route every pending message to its controller,
    // run every controller's pre-tick, then every controller's post-tick, then advance the
    // local tick. Everything runs synchronously on the caller's thread; wall-clock pacing
    // is up to the caller.
    class Session
    {
    public:
        struct Stats
        {
            std::uint64_t steps = 0;
            std::uint64_t messagesRouted = 0;
            std::uint64_t messagesUndeliverable = 0;
        };

        Session(SessionConfig cfg, std::shared_ptr<ITransport> transport)
            : m_cfg(cfg), m_transport(std::move(transport)), m_tick(cfg.startTick)
        {
            if (!m_transport)
            {
                throw std::runtime_error("Session requires a transport");
            }
            if (m_cfg.logLevel != LogLevel::Off)
            {
                Logger::instance().set_level(m_cfg.logLevel);
            }
        }

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        // The returned handle unregisters the controller when destroyed.
        ControllerRegistration attach(IController &controller)
        {
            return ControllerRegistration(m_registry, controller);
        }

        ControllerRegistry &registry() noexcept { return m_registry; }
        const ControllerRegistry &registry() const noexcept { return m_registry; }

        ITransport &transport() noexcept { return *m_transport; }

        // The tick the next step() will process.
        Tick tick() const noexcept { return m_tick; }

        PeerId self() const noexcept { return m_cfg.self; }

        const Stats &stats() const noexcept { return m_stats; }

        // Routes pending messages without ticking. Returns how many were accepted.
        std::size_t pump()
        {
            std::size_t accepted = 0;
            std::size_t routed = 0;
            while (m_cfg.maxMessagesPerStep == 0 || routed < m_cfg.maxMessagesPerStep)
            {
                auto msg = m_transport->poll();
                if (!msg)
                {
                    break;
                }
                ++routed;
                ++m_stats.messagesRouted;
                if (m_registry.deliver(*msg))
                {
                    ++accepted;
                }
                else
                {
                    ++m_stats.messagesUndeliverable;
                }
            }
            return accepted;
        }

        void step()
        {
            pump();

            const Tick tick = m_tick;
            m_registry.for_each([tick](IController &c)
                                { c.on_tick(tick); });
            m_registry.for_each([tick](IController &c)
                                { c.on_post_tick(tick); });

            ++m_tick;
            ++m_stats.steps;
        }

        void run(std::uint64_t steps)
        {
            for (std::uint64_t i = 0; i < steps; ++i)
            {
                step();
            }
        }

    private:
        SessionConfig m_cfg;
        std::shared_ptr<ITransport> m_transport;
        ControllerRegistry m_registry;
        Tick m_tick = 0;
        Stats m_stats{};
    };
}
