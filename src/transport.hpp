#pragma once

#include "common.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace tickback
{
    enum class MessageKind : std::uint8_t
    {
        // Owner -> authority: (tick, input, predicted state).
        InputSubmission = 1,
        // Authority -> owner/observer: (tick, authoritative state).
        Correction = 2,
        // Observer -> authority: (tick, locally simulated state) of a shared entity.
        StateReport = 3,
    };

    struct WireMessage
    {
        MessageKind kind = MessageKind::InputSubmission;
        PeerId src = 0;
        PeerId dst = 0;
        EntityId entity = 0;
        ByteBuffer bytes;
    };

    class ITransport
    {
    public:
        virtual ~ITransport() = default;
        virtual void send(WireMessage msg) = 0;
        virtual std::optional<WireMessage> poll() = 0;
        virtual bool has_pending() const = 0;
    };

    // In-process network connecting any number of peers.
    //
    // Each destination peer has its own FIFO mailbox. Messages become visible to the
    // receiver `latency` steps after they were sent (advance() moves time forward),
    // and an optional drop filter can discard messages to emulate packet loss.
    // Thread-safe, although the drivers in this repo only use it from one thread.
    class LoopbackNetwork
    {
    public:
        using DropFilter = std::function<bool(const WireMessage &)>;

        struct Stats
        {
            std::uint64_t sent = 0;
            std::uint64_t dropped = 0;
            std::uint64_t delivered = 0;
        };

        explicit LoopbackNetwork(std::uint64_t latencySteps = 0) : m_latency(latencySteps) {}

        void set_latency(std::uint64_t steps)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_latency = steps;
        }

        // Returning true from the filter drops the message.
        void set_drop_filter(DropFilter filter)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_dropFilter = std::move(filter);
        }

        void advance(std::uint64_t steps = 1)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_now += steps;
        }

        std::uint64_t now() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_now;
        }

        void push(WireMessage msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            ++m_stats.sent;
            if (m_dropFilter && m_dropFilter(msg))
            {
                ++m_stats.dropped;
                return;
            }
            const PeerId dst = msg.dst;
            m_mailboxes[dst].push_back(Pending{m_now + m_latency, std::move(msg)});
        }

        std::optional<WireMessage> pop(PeerId peer)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_mailboxes.find(peer);
            if (it == m_mailboxes.end() || it->second.empty() || it->second.front().deliverAt > m_now)
            {
                return std::nullopt;
            }
            WireMessage out = std::move(it->second.front().msg);
            it->second.pop_front();
            ++m_stats.delivered;
            return out;
        }

        // True if anything is queued for `peer`, ready or still in flight.
        bool has_pending(PeerId peer) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_mailboxes.find(peer);
            return it != m_mailboxes.end() && !it->second.empty();
        }

        Stats stats() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_stats;
        }

    private:
        struct Pending
        {
            std::uint64_t deliverAt = 0;
            WireMessage msg;
        };

        mutable std::mutex m_mu;
        std::uint64_t m_now = 0;
        std::uint64_t m_latency = 0;
        DropFilter m_dropFilter;
        std::unordered_map<PeerId, std::deque<Pending>> m_mailboxes;
        Stats m_stats{};
    };

    // One peer's view of a LoopbackNetwork.
    class LoopbackEndpoint final : public ITransport
    {
    public:
        LoopbackEndpoint(std::shared_ptr<LoopbackNetwork> network, PeerId self)
            : m_network(std::move(network)), m_self(self)
        {
            if (!m_network)
            {
                throw std::runtime_error("LoopbackEndpoint requires a network");
            }
        }

        PeerId self() const noexcept { return m_self; }

        void send(WireMessage msg) override
        {
            msg.src = m_self;
            m_network->push(std::move(msg));
        }

        std::optional<WireMessage> poll() override
        {
            return m_network->pop(m_self);
        }

        bool has_pending() const override
        {
            return m_network->has_pending(m_self);
        }

    private:
        std::shared_ptr<LoopbackNetwork> m_network;
        PeerId m_self = 0;
    };
}
