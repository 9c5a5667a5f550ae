#pragma once

#include "config.hpp"
#include "controller_interface.hpp"
#include "history.hpp"
#include "log.hpp"
#include "payload.hpp"
#include "reconciliation.hpp"
#include "transport.hpp"

#include <map>
#include <memory>
#include <stdexcept>

namespace tickback
{
    // Reconciliation for entities nobody owns (moving obstacles, NPCs): every peer
    // simulates them without input, observers report what they computed, and the
    // authority corrects the observers that drifted.
    //
    // `Model` must provide:
    //
    //   using State = ...;
    //   State gather_state() const;
    //   void simulate(double dt, bool replay);
    //   bool tolerant_equals(const State &a, const State &b) const;
    //   void apply_state(const State &state);
    //
    // The authority keeps one report history per connection, keyed by peer id. They are
    // only touched from its own receive/post-tick callbacks.
    template <class Model>
    class SharedEntityController final : public IController
    {
    public:
        using State = typename Model::State;

        struct Stats
        {
            std::uint64_t simulatedTicks = 0;

            // Observer.
            std::uint64_t reportsSent = 0;
            std::uint64_t correctionsApplied = 0;
            std::uint64_t correctionsIgnored = 0;
            std::uint64_t spuriousCorrections = 0;
            std::uint64_t replayedTicks = 0;

            // Authority.
            std::uint64_t reportsAccepted = 0;
            std::uint64_t illegalReports = 0;
            std::uint64_t reportsCompared = 0;
            std::uint64_t reportsUnverifiable = 0;
            std::uint64_t correctionsSent = 0;

            std::uint64_t rejectedMessages = 0;
            std::uint64_t reentrantRejections = 0;
        };

        SharedEntityController(ControllerConfig cfg, Model &model, std::shared_ptr<ITransport> transport)
            : m_cfg(cfg), m_model(model), m_transport(std::move(transport)), m_states(cfg.historyCapacity)
        {
            if (!m_transport)
            {
                throw std::runtime_error("SharedEntityController requires a transport");
            }
            if (m_cfg.role == Role::Owner)
            {
                throw std::invalid_argument("SharedEntityController: shared entities have no owner");
            }
            validate_controller_config(m_cfg);

            if (m_cfg.logLevel != LogLevel::Off)
            {
                Logger::instance().set_level(m_cfg.logLevel);
            }
        }

        SharedEntityController(const SharedEntityController &) = delete;
        SharedEntityController &operator=(const SharedEntityController &) = delete;

        EntityId entity() const noexcept override { return m_cfg.entity; }
        Role role() const noexcept override { return m_cfg.role; }

        History<State> &states() noexcept { return m_states; }
        const History<State> &states() const noexcept { return m_states; }

        const Stats &stats() const noexcept { return m_stats; }

        std::size_t connection_count() const noexcept { return m_connections.size(); }

        // Pending (not yet compared) reports from `peer`, or nullptr if it never reported.
        const History<State> *reports_from(PeerId peer) const
        {
            auto it = m_connections.find(peer);
            return it == m_connections.end() ? nullptr : &it->second.reports;
        }

        // Forgets everything reported by `peer` (disconnect).
        bool drop_connection(PeerId peer)
        {
            return m_connections.erase(peer) > 0;
        }

        void on_tick(Tick localTick) override
        {
            m_localTick = localTick;
            m_model.simulate(m_cfg.tickDelta, /*replay=*/false);
            ++m_stats.simulatedTicks;
        }

        void on_post_tick(Tick localTick) override
        {
            const State state = m_model.gather_state();
            m_states.write(localTick, state);

            if (m_cfg.role == Role::Authority)
            {
                compare_reports_(localTick);
                return;
            }

            WireMessage msg;
            msg.kind = MessageKind::StateReport;
            msg.src = m_cfg.self;
            msg.dst = m_cfg.serverPeer;
            msg.entity = m_cfg.entity;
            msg.bytes = encode_tick_state(TickState<State>{localTick, state}, m_cfg.payloadCapacity);
            m_transport->send(std::move(msg));
            ++m_stats.reportsSent;
        }

        bool receive(const WireMessage &msg) override
        {
            if (msg.entity != m_cfg.entity)
            {
                return false;
            }

            if (msg.kind == MessageKind::StateReport && m_cfg.role == Role::Authority)
            {
                TickState<State> ts;
                try
                {
                    ts = decode_tick_state<State>(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
                }
                catch (const std::runtime_error &e)
                {
                    return reject_(msg, e.what());
                }
                return accept_report(msg.src, ts.tick, ts.state);
            }

            if (msg.kind == MessageKind::Correction && m_cfg.role == Role::Observer && msg.src == m_cfg.serverPeer)
            {
                TickState<State> ts;
                try
                {
                    ts = decode_tick_state<State>(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
                }
                catch (const std::runtime_error &e)
                {
                    return reject_(msg, e.what());
                }
                return reconcile(ts.tick, ts.state);
            }

            return reject_(msg, "unexpected message for this role");
        }

        // Authority: buffers the state `peer` computed for `tick`. Reports must be strictly
        // newer than that peer's previous report.
        bool accept_report(PeerId peer, Tick tick, const State &state)
        {
            auto [it, inserted] = m_connections.try_emplace(peer, m_cfg.historyCapacity);
            Connection &conn = it->second;
            if (!inserted && tick <= conn.lastReportTick)
            {
                ++m_stats.illegalReports;
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, tick,
                                        "illegal state report from peer %u (last report %llu)",
                                        static_cast<unsigned>(peer),
                                        static_cast<unsigned long long>(conn.lastReportTick));
                return false;
            }
            conn.reports.write(tick, state);
            conn.lastReportTick = tick;
            ++m_stats.reportsAccepted;
            return true;
        }

        // Observer: same delivery procedure as for owned entities, replaying without input.
        bool reconcile(Tick tick, const State &authoritative)
        {
            if (m_replaying)
            {
                ++m_stats.reentrantRejections;
                return false;
            }
            ReplayScope scope(m_replaying);

            const ReconcileResult result = reconcile_history(
                m_states, tick, authoritative,
                [this](const State &local, const State &auth)
                { return !m_model.tolerant_equals(local, auth); },
                [this](const State &s)
                { m_model.apply_state(s); },
                [this](Tick, State &out)
                {
                    m_model.simulate(m_cfg.tickDelta, /*replay=*/true);
                    out = m_model.gather_state();
                    return true;
                });

            switch (result.outcome)
            {
            case ReconcileOutcome::NoLocalState:
                ++m_stats.correctionsIgnored;
                return false;
            case ReconcileOutcome::NoDivergence:
                ++m_stats.spuriousCorrections;
                return false;
            case ReconcileOutcome::Rewound:
                break;
            }

            ++m_stats.correctionsApplied;
            m_stats.replayedTicks += result.replayedTicks;
            Logger::instance().logf(LogLevel::Info, m_cfg.self, m_cfg.entity, tick,
                                    "shared entity corrected, replayed %llu ticks",
                                    static_cast<unsigned long long>(result.replayedTicks));
            return true;
        }

        bool rollback_to(Tick tick) override
        {
            State state{};
            if (m_replaying || !m_states.read(tick, state))
            {
                return false;
            }
            m_model.apply_state(state);
            return true;
        }

        bool reset_state() override
        {
            if (m_replaying || m_states.empty())
            {
                return false;
            }
            m_model.apply_state(m_states[m_states.size() - 1]);
            return true;
        }

    private:
        struct Connection
        {
            explicit Connection(std::size_t capacity) : reports(capacity) {}

            History<State> reports;
            Tick lastReportTick = 0;
        };

        // Compares every report at or before `now` and sends at most one correction per
        // connection: the oldest divergent tick. Its replay recomputes everything after it.
        void compare_reports_(Tick now)
        {
            for (auto &[peer, conn] : m_connections)
            {
                std::size_t consumed = 0;
                bool corrected = false;
                while (consumed < conn.reports.size() && conn.reports.entry_tick(consumed) <= now)
                {
                    const Tick t = conn.reports.entry_tick(consumed);
                    State authoritative{};
                    if (!m_states.read(t, authoritative))
                    {
                        ++m_stats.reportsUnverifiable;
                        Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, t,
                                                "report from peer %u has no authoritative counterpart",
                                                static_cast<unsigned>(peer));
                    }
                    else
                    {
                        ++m_stats.reportsCompared;
                        if (!corrected && !m_model.tolerant_equals(authoritative, conn.reports[consumed]))
                        {
                            send_correction_(peer, t, authoritative);
                            corrected = true;
                        }
                    }
                    ++consumed;
                }
                if (consumed > 0)
                {
                    conn.reports.clear_past(conn.reports.entry_tick(consumed - 1), /*inclusive=*/true);
                }
            }
        }

        void send_correction_(PeerId peer, Tick tick, const State &state)
        {
            WireMessage msg;
            msg.kind = MessageKind::Correction;
            msg.src = m_cfg.self;
            msg.dst = peer;
            msg.entity = m_cfg.entity;
            msg.bytes = encode_tick_state(TickState<State>{tick, state}, m_cfg.payloadCapacity);
            m_transport->send(std::move(msg));
            ++m_stats.correctionsSent;
            Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, tick,
                                    "peer %u diverged, correction sent",
                                    static_cast<unsigned>(peer));
        }

        bool reject_(const WireMessage &msg, const char *why)
        {
            ++m_stats.rejectedMessages;
            Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, m_localTick,
                                    "dropping message kind=%u from peer %u: %s",
                                    static_cast<unsigned>(msg.kind),
                                    static_cast<unsigned>(msg.src),
                                    why);
            return false;
        }

        ControllerConfig m_cfg;
        Model &m_model;
        std::shared_ptr<ITransport> m_transport;

        History<State> m_states;
        std::map<PeerId, Connection> m_connections;

        Tick m_localTick = 0;
        bool m_replaying = false;

        Stats m_stats{};
    };
}
