#pragma once

#include "catch_up.hpp"
#include "config.hpp"
#include "controller_interface.hpp"
#include "history.hpp"
#include "log.hpp"
#include "payload.hpp"
#include "reconciliation.hpp"
#include "transport.hpp"

#include <memory>
#include <stdexcept>

namespace tickback
{
    // Client prediction / server reconciliation for one input-driven entity.
    //
    // `Model` is the entity's simulation and must provide:
    //
    //   using Input = ...;  // copyable, default-constructible, PayloadCodec-able
    //   using State = ...;  // same
    //   Input gather_input();
    //   State gather_state() const;
    //   void simulate(const Input &input, double dt, bool replay);
    //   bool tolerant_equals(const State &a, const State &b) const;
    //   void apply_state(const State &state);
    //
    // `simulate` must be deterministic given the same starting state, input and dt.
    // `replay` is true while re-simulating after a correction so one-shot side effects
    // (sounds, particles) can be skipped.
    //
    // The controller does not own the model; the model must outlive it.
    template <class Model>
    class Controller final : public IController
    {
    public:
        using Input = typename Model::Input;
        using State = typename Model::State;

        static_assert(std::is_default_constructible_v<Input> && std::is_copy_constructible_v<Input>,
                      "Model::Input must be default-constructible and copyable");
        static_assert(std::is_default_constructible_v<State> && std::is_copy_constructible_v<State>,
                      "Model::State must be default-constructible and copyable");

        struct Stats
        {
            // Owner.
            std::uint64_t predictedTicks = 0;
            std::uint64_t inputsSent = 0;
            std::uint64_t correctionsApplied = 0;
            std::uint64_t correctionsIgnored = 0;
            std::uint64_t spuriousCorrections = 0;
            std::uint64_t replayedTicks = 0;
            std::uint64_t replaySkippedTicks = 0;

            // Authority.
            std::uint64_t inputsAccepted = 0;
            std::uint64_t illegalInputs = 0;
            std::uint64_t serverTicks = 0;
            std::uint64_t droppedInputs = 0;
            std::uint64_t stalls = 0;
            std::uint64_t catchUpJumps = 0;
            std::uint64_t catchUpSkippedTicks = 0;
            std::uint64_t correctionsSent = 0;

            // Either role.
            std::uint64_t rejectedMessages = 0;
            std::uint64_t reentrantRejections = 0;
        };

        Controller(ControllerConfig cfg, Model &model, std::shared_ptr<ITransport> transport)
            : m_cfg(cfg),
              m_model(model),
              m_transport(std::move(transport)),
              m_inputs(cfg.historyCapacity),
              m_states(cfg.historyCapacity)
        {
            if (!m_transport)
            {
                throw std::runtime_error("Controller requires a transport");
            }
            validate_controller_config(m_cfg);

            if (m_cfg.logLevel != LogLevel::Off)
            {
                Logger::instance().set_level(m_cfg.logLevel);
            }
        }

        Controller(const Controller &) = delete;
        Controller &operator=(const Controller &) = delete;

        const ControllerConfig &config() const noexcept { return m_cfg; }

        EntityId entity() const noexcept override { return m_cfg.entity; }
        Role role() const noexcept override { return m_cfg.role; }

        // The tick currently being processed: the driver's local tick for the owner, the
        // server cursor otherwise.
        Tick controller_tick() const noexcept
        {
            return m_cfg.role == Role::Owner ? m_localTick : m_serverTick;
        }

        Tick server_tick() const noexcept { return m_serverTick; }

        bool replaying() const noexcept { return m_replaying; }

        History<Input> &inputs() noexcept { return m_inputs; }
        const History<Input> &inputs() const noexcept { return m_inputs; }
        History<State> &states() noexcept { return m_states; }
        const History<State> &states() const noexcept { return m_states; }

        const Stats &stats() const noexcept { return m_stats; }

        void on_tick(Tick localTick) override
        {
            m_localTick = localTick;
            switch (m_cfg.role)
            {
            case Role::Owner:
                predict_(localTick);
                break;
            case Role::Authority:
                server_step_();
                break;
            case Role::Observer:
                break;
            }
        }

        void on_post_tick(Tick localTick) override
        {
            if (m_cfg.role != Role::Owner)
            {
                return;
            }
            record_and_transmit_(localTick);
        }

        bool receive(const WireMessage &msg) override
        {
            if (msg.entity != m_cfg.entity)
            {
                return false;
            }

            switch (msg.kind)
            {
            case MessageKind::InputSubmission:
            {
                if (m_cfg.role != Role::Authority || msg.src != m_cfg.ownerPeer)
                {
                    return reject_(msg, "input submission from a non-owner or to a non-authority");
                }
                InputSubmission<Input, State> sub;
                try
                {
                    sub = decode_input_submission<Input, State>(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
                }
                catch (const std::runtime_error &e)
                {
                    return reject_(msg, e.what());
                }
                return submit_input(sub.tick, sub.input, sub.state);
            }
            case MessageKind::Correction:
            {
                if (m_cfg.role != Role::Owner || msg.src != m_cfg.serverPeer)
                {
                    return reject_(msg, "correction from a non-server or to a non-owner");
                }
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
            case MessageKind::StateReport:
                break;
            }
            return reject_(msg, "unexpected message kind");
        }

        // Authority: buffers a client's input and claimed state for `tick`. Only ticks newer
        // than everything already buffered are accepted; the first accepted tick becomes the
        // server cursor.
        bool submit_input(Tick tick, const Input &input, const State &state)
        {
            const bool firstInput = m_inputs.empty();
            if (!firstInput && tick <= m_inputs.most_recent_tick())
            {
                ++m_stats.illegalInputs;
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, tick,
                                        "illegal input received (most recent buffered tick %llu)",
                                        static_cast<unsigned long long>(m_inputs.most_recent_tick()));
                return false;
            }

            if (firstInput)
            {
                m_serverTick = tick;
            }

            m_inputs.write(tick, input);
            m_states.write(tick, state);
            ++m_stats.inputsAccepted;
            return true;
        }

        // Owner: applies an authoritative state for `tick`. Returns true if the local
        // history was rewritten and replayed, false if the correction was a no-op or was
        // refused because a replay is already running.
        bool reconcile(Tick tick, const State &authoritative)
        {
            if (m_replaying)
            {
                ++m_stats.reentrantRejections;
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, tick,
                                        "correction refused: replay already in progress");
                return false;
            }

            ReplayScope scope(m_replaying);

            const ReconcileResult result = reconcile_history(
                m_states, tick, authoritative,
                [this](const State &local, const State &auth)
                { return !m_model.tolerant_equals(local, auth); },
                [this](const State &s)
                { m_model.apply_state(s); },
                [this](Tick t, State &out)
                {
                    Input input{};
                    if (!m_inputs.read(t, input))
                    {
                        return false;
                    }
                    m_model.simulate(input, m_cfg.tickDelta, /*replay=*/true);
                    out = m_model.gather_state();
                    return true;
                },
                [this](Tick t)
                {
                    Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, t,
                                            "replay skipping missing input");
                });

            switch (result.outcome)
            {
            case ReconcileOutcome::NoLocalState:
                ++m_stats.correctionsIgnored;
                Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, tick,
                                        "correction ignored: no local prediction for this tick");
                return false;
            case ReconcileOutcome::NoDivergence:
                ++m_stats.spuriousCorrections;
                Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, tick,
                                        "correction ignored: local history already agrees");
                return false;
            case ReconcileOutcome::Rewound:
                break;
            }

            ++m_stats.correctionsApplied;
            m_stats.replayedTicks += result.replayedTicks;
            m_stats.replaySkippedTicks += result.skippedTicks;
            Logger::instance().logf(LogLevel::Info, m_cfg.self, m_cfg.entity, tick,
                                    "rewound and replayed %llu ticks up to %llu (%llu skipped)",
                                    static_cast<unsigned long long>(result.replayedTicks),
                                    static_cast<unsigned long long>(result.presentTick),
                                    static_cast<unsigned long long>(result.skippedTicks));
            return true;
        }

        bool rollback_to(Tick tick) override
        {
            if (m_replaying)
            {
                ++m_stats.reentrantRejections;
                return false;
            }
            State state{};
            if (!m_states.read(tick, state))
            {
                Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, tick,
                                        "rollback target not in state history");
                return false;
            }
            m_model.apply_state(state);
            return true;
        }

        bool reset_state() override
        {
            if (m_replaying)
            {
                ++m_stats.reentrantRejections;
                return false;
            }
            if (m_states.empty())
            {
                return false;
            }
            m_model.apply_state(m_states[m_states.size() - 1]);
            return true;
        }

    private:
        void predict_(Tick tick)
        {
            const Input input = m_model.gather_input();
            m_model.simulate(input, m_cfg.tickDelta, /*replay=*/false);
            m_inputs.write(tick, input);
            ++m_stats.predictedTicks;
        }

        void record_and_transmit_(Tick tick)
        {
            InputSubmission<Input, State> sub;
            sub.tick = tick;
            sub.state = m_model.gather_state();
            m_states.write(tick, sub.state);

            if (!m_inputs.read(tick, sub.input))
            {
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, tick,
                                        "no input recorded for this tick, nothing to submit");
                return;
            }

            WireMessage msg;
            msg.kind = MessageKind::InputSubmission;
            msg.src = m_cfg.self;
            msg.dst = m_cfg.serverPeer;
            msg.entity = m_cfg.entity;
            msg.bytes = encode_input_submission(sub, m_cfg.payloadCapacity);
            m_transport->send(std::move(msg));
            ++m_stats.inputsSent;
        }

        void server_step_()
        {
            const ServerStepPlan plan = plan_server_step(m_inputs, m_serverTick, m_cfg.catchUp);
            if (plan.kind == ServerStepKind::Idle)
            {
                return;
            }

            if (plan.skippedTicks > 0)
            {
                ++m_stats.catchUpJumps;
                m_stats.catchUpSkippedTicks += plan.skippedTicks;
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, m_serverTick,
                                        "too many inputs behind, catching up: skipped %llu ticks",
                                        static_cast<unsigned long long>(plan.skippedTicks));
                m_serverTick = plan.tick;
            }

            Input input{};
            switch (plan.kind)
            {
            case ServerStepKind::Stall:
                ++m_stats.stalls;
                Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, m_serverTick,
                                        "waiting for missing tick");
                return;
            case ServerStepKind::SimulateDropped:
                ++m_stats.droppedInputs;
                Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, m_serverTick,
                                        "packet dropped, simulating default input");
                break;
            case ServerStepKind::Simulate:
            {
                std::size_t index = 0;
                if (m_inputs.find(m_serverTick, index))
                {
                    input = m_inputs[index];
                }
                break;
            }
            case ServerStepKind::Idle:
                return;
            }

            m_model.simulate(input, m_cfg.tickDelta, /*replay=*/false);
            const State serverState = m_model.gather_state();
            ++m_stats.serverTicks;

            // Missing client state compares against State{}; the owner re-checks on delivery.
            State clientState{};
            if (!m_states.read(m_serverTick, clientState))
            {
                Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, m_serverTick,
                                        "no client state buffered for this tick");
            }
            m_states.write(m_serverTick, serverState);

            if (!m_model.tolerant_equals(serverState, clientState))
            {
                send_correction_(m_serverTick, serverState);
            }

            m_serverTick += 1;
        }

        void send_correction_(Tick tick, const State &state)
        {
            WireMessage msg;
            msg.kind = MessageKind::Correction;
            msg.src = m_cfg.self;
            msg.dst = m_cfg.ownerPeer;
            msg.entity = m_cfg.entity;
            msg.bytes = encode_tick_state(TickState<State>{tick, state}, m_cfg.payloadCapacity);
            m_transport->send(std::move(msg));
            ++m_stats.correctionsSent;
            Logger::instance().logf(LogLevel::Debug, m_cfg.self, m_cfg.entity, tick,
                                    "client state diverged, correction sent to peer %u",
                                    static_cast<unsigned>(m_cfg.ownerPeer));
        }

        bool reject_(const WireMessage &msg, const char *why)
        {
            ++m_stats.rejectedMessages;
            Logger::instance().logf(LogLevel::Warn, m_cfg.self, m_cfg.entity, controller_tick(),
                                    "dropping message kind=%u from peer %u: %s",
                                    static_cast<unsigned>(msg.kind),
                                    static_cast<unsigned>(msg.src),
                                    why);
            return false;
        }

        ControllerConfig m_cfg;
        Model &m_model;
        std::shared_ptr<ITransport> m_transport;

        History<Input> m_inputs;
        History<State> m_states;

        Tick m_localTick = 0;
        Tick m_serverTick = 0;
        bool m_replaying = false;

        Stats m_stats{};
    };
}
