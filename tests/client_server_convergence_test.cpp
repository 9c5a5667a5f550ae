/*
Purpose: End-to-end client prediction / server reconciliation over a lossy, delayed link.

What this tests: A client session owning a cube and a server session simulating it talk
over a LoopbackNetwork with latency and random loss of inputs and corrections. The server
also pushes the cube once (knockback) which the client cannot predict. Once the link is
clean again, the client's state history matches the server's authoritative states for
every tick both have recorded.
*/

#include "controller.hpp"
#include "random.hpp"
#include "session.hpp"
#include "test_models.hpp"

#include <cassert>
#include <cmath>
#include <memory>

namespace
{
    using Model = tickback_test::CubeModel;
    using tickback_test::CubeInput;
    using tickback_test::CubeState;

    constexpr tickback::EntityId kEntity = 1;
    constexpr tickback::PeerId kServer = 0;
    constexpr tickback::PeerId kClient = 1;

    // Advances both peers by one frame, then lets the link move forward.
    void frame(tickback::Session &client, tickback::Session &server, tickback::LoopbackNetwork &net)
    {
        client.step();
        server.step();
        net.advance();
    }
}

int main()
{
    auto net = std::make_shared<tickback::LoopbackNetwork>(/*latencySteps=*/3);
    auto clientEndpoint = std::make_shared<tickback::LoopbackEndpoint>(net, kClient);
    auto serverEndpoint = std::make_shared<tickback::LoopbackEndpoint>(net, kServer);

    tickback::Session clientSession(tickback::SessionConfig{.self = kClient}, clientEndpoint);
    tickback::Session serverSession(tickback::SessionConfig{.self = kServer}, serverEndpoint);

    tickback::ControllerConfig base;
    base.entity = kEntity;
    base.serverPeer = kServer;
    base.ownerPeer = kClient;

    tickback::ControllerConfig clientCfg = base;
    clientCfg.role = tickback::Role::Owner;
    clientCfg.self = kClient;

    tickback::ControllerConfig serverCfg = base;
    serverCfg.role = tickback::Role::Authority;
    serverCfg.self = kServer;

    Model clientModel;
    clientModel.script = [](std::uint64_t n)
    {
        const auto dx = static_cast<std::int32_t>(tickback::rng_u64_range(7, 0, n / 5, 0, 2)) - 1;
        const auto dy = static_cast<std::int32_t>(tickback::rng_u64_range(7, 1, n / 9, 0, 2)) - 1;
        return CubeInput{dx, dy};
    };
    Model serverModel;

    tickback::Controller<Model> client(clientCfg, clientModel, clientEndpoint);
    tickback::Controller<Model> server(serverCfg, serverModel, serverEndpoint);

    auto clientReg = clientSession.attach(client);
    auto serverReg = serverSession.attach(server);

    // Phase 1: lossy link.
    std::uint64_t offered = 0;
    net->set_drop_filter([&offered](const tickback::WireMessage &msg)
                         {
                             const std::uint64_t k = offered++;
                             return tickback::rng_unit_double(42, static_cast<std::uint32_t>(msg.kind), k) < 0.15; });

    for (int i = 0; i < 200; ++i)
    {
        frame(clientSession, serverSession, *net);
    }

    assert(net->stats().dropped > 0);
    assert(server.stats().droppedInputs > 0);
    assert(server.stats().correctionsSent > 0);
    assert(client.stats().correctionsApplied > 0);
    assert(client.stats().replayedTicks > 0);
    assert(clientModel.replaySteps == client.stats().replayedTicks);

    // Phase 2: clean link, let in-flight corrections settle.
    net->set_drop_filter(nullptr);
    for (int i = 0; i < 60; ++i)
    {
        frame(clientSession, serverSession, *net);
    }

    // Knockback: the server pushes the cube on its next simulated tick.
    const std::uint64_t appliedBefore = client.stats().correctionsApplied;
    const tickback::Tick pushedTick = server.server_tick();
    serverModel.pendingPushX = 2.0;

    for (int i = 0; i < 80; ++i)
    {
        frame(clientSession, serverSession, *net);
    }

    assert(client.stats().correctionsApplied > appliedBefore);
    {
        CubeState authoritative{};
        CubeState predicted{};
        assert(server.states().read(pushedTick, authoritative));
        assert(client.states().read(pushedTick, predicted));
        assert(clientModel.tolerant_equals(authoritative, predicted));
    }

    // Every tick the server settled well in the past agrees with the client.
    const tickback::Tick newest = server.server_tick();
    assert(newest > 60);
    std::size_t compared = 0;
    for (tickback::Tick t = newest - 60; t + 20 < newest; ++t)
    {
        CubeState authoritative{};
        CubeState predicted{};
        if (!server.states().read(t, authoritative) || !client.states().read(t, predicted))
        {
            continue;
        }
        assert(clientModel.tolerant_equals(authoritative, predicted));
        ++compared;
    }
    assert(compared > 30);

    // The client ran ahead of the server by roughly latency plus buffering.
    assert(clientSession.tick() == serverSession.tick());
    assert(client.controller_tick() > server.server_tick());
    assert(server.stats().illegalInputs == 0);
    assert(client.stats().reentrantRejections == 0);

    return 0;
}
