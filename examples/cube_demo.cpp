#include "controller.hpp"
#include "determinism.hpp"
#include "random.hpp"
#include "session.hpp"
#include "shared_entity.hpp"
#include "transport.hpp"

#if defined(TICKBACK_HAS_MPI)
#include "mpi_transport.hpp"
#include <mpi.h>
#endif

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <string_view>

// A player-owned cube and a server-driven obstacle, client and server in one process over
// a lossy, delayed loopback link, or on two MPI ranks (rank 0 = server, rank 1 = client).
namespace
{
    constexpr tickback::PeerId kServer = 0;
    constexpr tickback::PeerId kClient = 1;

    constexpr tickback::EntityId kCube = 1;
    constexpr tickback::EntityId kObstacle = 2;

    struct Params
    {
        std::uint64_t ticks = 600;
        std::uint64_t settleTicks = 60;
        std::uint64_t latency = 4;
        double loss = 0.05;
        std::uint64_t seed = 1;

        // Server pushes the cube every N ticks (0 = never).
        std::uint64_t knockbackEvery = 150;

        std::uint32_t minBuffer = 5;
        std::uint32_t maxBuffer = 10;
        std::uint32_t capacity = 1024;

        tickback::LogLevel logLevel = tickback::LogLevel::Off;
        bool verify = false;
    };

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

    class CubeModel
    {
    public:
        using Input = CubeInput;
        using State = CubeState;

        explicit CubeModel(std::uint64_t seed) : m_seed(seed) {}

        // Client "keyboard": a random direction held for a few ticks.
        CubeInput gather_input()
        {
            const std::uint64_t held = m_gathered++ / 12;
            return CubeInput{static_cast<std::int32_t>(tickback::rng_u64_range(m_seed, 0, held, 0, 2)) - 1,
                             static_cast<std::int32_t>(tickback::rng_u64_range(m_seed, 1, held, 0, 2)) - 1};
        }

        CubeState gather_state() const { return m_state; }

        void simulate(const CubeInput &in, double dt, bool replay)
        {
            m_state.x += static_cast<double>(in.dx) * kSpeed * dt;
            m_state.y += static_cast<double>(in.dy) * kSpeed * dt;
            if (!replay && m_push != 0.0)
            {
                m_state.x += m_push;
                m_push = 0.0;
            }
        }

        bool tolerant_equals(const CubeState &a, const CubeState &b) const
        {
            return std::fabs(a.x - b.x) <= 1e-4 && std::fabs(a.y - b.y) <= 1e-4;
        }

        void apply_state(const CubeState &s) { m_state = s; }

        void knock_back(double dx) { m_push += dx; }

    private:
        static constexpr double kSpeed = 6.0;

        std::uint64_t m_seed = 0;
        std::uint64_t m_gathered = 0;
        double m_push = 0.0;
        CubeState m_state{};
    };

    struct ObstacleState
    {
        double x = 0.0;
        double dir = 1.0;
    };

    class ObstacleModel
    {
    public:
        using State = ObstacleState;

        ObstacleState gather_state() const { return m_state; }

        void simulate(double dt, bool)
        {
            m_state.x += m_state.dir * 2.0 * dt;
            if (std::fabs(m_state.x) > 4.0)
            {
                m_state.x = std::copysign(4.0, m_state.x);
                m_state.dir = -m_state.dir;
            }
        }

        bool tolerant_equals(const ObstacleState &a, const ObstacleState &b) const
        {
            return std::fabs(a.x - b.x) <= 1e-4 && a.dir == b.dir;
        }

        void apply_state(const ObstacleState &s) { m_state = s; }

        void nudge(double dx) { m_state.x += dx; }

    private:
        ObstacleState m_state{};
    };

    // Everything one peer runs: its session plus one controller per entity.
    struct Peer
    {
        Peer(tickback::PeerId self, std::shared_ptr<tickback::ITransport> transport, const Params &p)
            : session(tickback::SessionConfig{.self = self, .logLevel = p.logLevel}, transport),
              cube(p.seed),
              player(make_config(self, kCube, self == kServer ? tickback::Role::Authority : tickback::Role::Owner, p), cube, transport),
              npc(make_config(self, kObstacle, self == kServer ? tickback::Role::Authority : tickback::Role::Observer, p), obstacle, transport),
              playerReg(session.attach(player)),
              npcReg(session.attach(npc))
        {
        }

        static tickback::ControllerConfig make_config(tickback::PeerId self, tickback::EntityId entity, tickback::Role role, const Params &p)
        {
            tickback::ControllerConfig cfg;
            cfg.entity = entity;
            cfg.role = role;
            cfg.self = self;
            cfg.serverPeer = kServer;
            cfg.ownerPeer = kClient;
            cfg.historyCapacity = p.capacity;
            cfg.catchUp.minBuffer = p.minBuffer;
            cfg.catchUp.maxBuffer = p.maxBuffer;
            return cfg;
        }

        tickback::Session session;
        CubeModel cube;
        ObstacleModel obstacle;
        tickback::Controller<CubeModel> player;
        tickback::SharedEntityController<ObstacleModel> npc;
        tickback::ControllerRegistration playerReg;
        tickback::ControllerRegistration npcReg;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    bool parse_double(std::string_view s, double &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "Client prediction / server reconciliation demo\n"
                      << "  --ticks N\n"
                      << "  --settle N\n"
                      << "  --latency STEPS      (in-process only)\n"
                      << "  --loss P             (in-process only)\n"
                      << "  --seed S\n"
                      << "  --knockback-every N\n"
                      << "  --min-buffer N\n"
                      << "  --max-buffer N\n"
                      << "  --capacity N\n"
                      << "  --log-level error|warn|info|debug|trace|off\n"
                      << "  --verify\n";
        }

#if defined(TICKBACK_HAS_MPI)
        MPI_Abort(MPI_COMM_WORLD, 2);
#endif
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--ticks")
            {
                if (!parse_u64(need(), p.ticks))
                    usage_and_exit(rank);
            }
            else if (a == "--settle")
            {
                if (!parse_u64(need(), p.settleTicks))
                    usage_and_exit(rank);
            }
            else if (a == "--latency")
            {
                if (!parse_u64(need(), p.latency))
                    usage_and_exit(rank);
            }
            else if (a == "--loss")
            {
                if (!parse_double(need(), p.loss))
                    usage_and_exit(rank);
            }
            else if (a == "--seed")
            {
                if (!parse_u64(need(), p.seed))
                    usage_and_exit(rank);
            }
            else if (a == "--knockback-every")
            {
                if (!parse_u64(need(), p.knockbackEvery))
                    usage_and_exit(rank);
            }
            else if (a == "--min-buffer")
            {
                if (!parse_u32(need(), p.minBuffer))
                    usage_and_exit(rank);
            }
            else if (a == "--max-buffer")
            {
                if (!parse_u32(need(), p.maxBuffer))
                    usage_and_exit(rank);
            }
            else if (a == "--capacity")
            {
                if (!parse_u32(need(), p.capacity))
                    usage_and_exit(rank);
            }
            else if (a == "--log-level")
            {
                if (!tickback::parse_log_level(need(), p.logLevel))
                    usage_and_exit(rank);
            }
            else if (a == "--verify")
            {
                p.verify = true;
            }
            else
            {
                usage_and_exit(rank);
            }
        }

        if (p.ticks == 0 || p.loss < 0.0 || p.loss >= 1.0 || p.minBuffer > p.maxBuffer)
        {
            usage_and_exit(rank);
        }
        return p;
    }

    // Scripted disturbances the client cannot predict.
    void disturb(Peer &peer, tickback::PeerId self, tickback::Tick tick, const Params &p)
    {
        if (self == kServer && p.knockbackEvery > 0 && tick > 0 && tick % p.knockbackEvery == 0)
        {
            peer.cube.knock_back(1.5);
        }
        if (self == kClient && tick == p.ticks / 3)
        {
            peer.obstacle.nudge(0.75);
        }
    }

    void print_stats(const Peer &peer, tickback::PeerId self)
    {
        const auto &c = peer.player.stats();
        const auto &n = peer.npc.stats();
        if (self == kServer)
        {
            std::cerr << "[cube_demo][peer=" << self << "] serverTicks=" << c.serverTicks
                      << " inputsAccepted=" << c.inputsAccepted << " dropped=" << c.droppedInputs
                      << " stalls=" << c.stalls << " catchUpJumps=" << c.catchUpJumps
                      << " catchUpSkipped=" << c.catchUpSkippedTicks << " correctionsSent=" << c.correctionsSent
                      << " obstacleCorrections=" << n.correctionsSent << "\n";
        }
        else
        {
            std::cerr << "[cube_demo][peer=" << self << "] predicted=" << c.predictedTicks
                      << " inputsSent=" << c.inputsSent << " corrected=" << c.correctionsApplied
                      << " spurious=" << c.spuriousCorrections << " replayed=" << c.replayedTicks
                      << " obstacleCorrected=" << n.correctionsApplied << "\n";
        }
    }

    // Window of ticks the server has settled long enough for corrections to have landed.
    void settled_window(const Peer &server, const Params &p, tickback::Tick &lo, tickback::Tick &hi)
    {
        const tickback::Tick newest = server.player.server_tick();
        const tickback::Tick margin = p.latency * 2 + p.maxBuffer;
        hi = newest > margin ? newest - margin : 0;
        lo = hi > p.settleTicks / 2 ? hi - p.settleTicks / 2 : 0;
    }

    int run_loopback(const Params &p)
    {
        auto net = std::make_shared<tickback::LoopbackNetwork>(p.latency);
        auto serverEndpoint = std::make_shared<tickback::LoopbackEndpoint>(net, kServer);
        auto clientEndpoint = std::make_shared<tickback::LoopbackEndpoint>(net, kClient);

        Peer server(kServer, serverEndpoint, p);
        Peer client(kClient, clientEndpoint, p);

        std::uint64_t offered = 0;
        net->set_drop_filter([&offered, &p](const tickback::WireMessage &)
                             { return tickback::rng_unit_double(p.seed, /*stream=*/7, offered++) < p.loss; });

        for (tickback::Tick t = 0; t < p.ticks + p.settleTicks; ++t)
        {
            if (t == p.ticks)
            {
                net->set_drop_filter(nullptr);
            }
            disturb(server, kServer, t, p);
            disturb(client, kClient, t, p);
            client.session.step();
            server.session.step();
            net->advance();
        }

        print_stats(server, kServer);
        print_stats(client, kClient);

        const auto ls = net->stats();
        std::cerr << "[cube_demo] link sent=" << ls.sent << " dropped=" << ls.dropped << " delivered=" << ls.delivered << "\n";

        tickback::Tick lo = 0;
        tickback::Tick hi = 0;
        settled_window(server, p, lo, hi);

        tickback::DeterminismAccumulator serverAcc;
        serverAcc.on_history(kCube, server.player.states(), lo, hi);
        serverAcc.on_history(kObstacle, server.npc.states(), lo, hi);

        tickback::DeterminismAccumulator clientAcc;
        clientAcc.on_history(kCube, client.player.states(), lo, hi);
        clientAcc.on_history(kObstacle, client.npc.states(), lo, hi);

        std::cout << "cube_demo window=[" << lo << "," << hi << "] hash=" << serverAcc.digest().stateSum << "\n";

        if (p.verify)
        {
            if (serverAcc.digest() != clientAcc.digest())
            {
                std::cerr << "cube_demo verify failed: client diverged from server\n";
                return 1;
            }
            std::cout << "cube_demo ok\n";
        }
        return 0;
    }

#if defined(TICKBACK_HAS_MPI)
    int run_mpi(const Params &p, int rank)
    {
        const auto self = static_cast<tickback::PeerId>(rank);
        auto transport = std::make_shared<tickback::MpiTransport>(MPI_COMM_WORLD, /*tag=*/5);
        Peer peer(self, transport, p);

        // Lock-step frames; the link itself is reliable, so only disturbances cause corrections.
        for (tickback::Tick t = 0; t < p.ticks + p.settleTicks; ++t)
        {
            disturb(peer, self, t, p);
            peer.session.step();
            MPI_Barrier(MPI_COMM_WORLD);
        }

        print_stats(peer, self);

        // The server picks the window and shares it with its digest.
        std::uint64_t window[2] = {0, 0};
        if (rank == 0)
        {
            settled_window(peer, p, window[0], window[1]);
        }
        MPI_Bcast(window, 2, MPI_UINT64_T, 0, MPI_COMM_WORLD);

        tickback::DeterminismAccumulator acc;
        acc.on_history(kCube, peer.player.states(), window[0], window[1]);
        acc.on_history(kObstacle, peer.npc.states(), window[0], window[1]);

        std::uint64_t local[3] = {acc.digest().entries, acc.digest().stateSum, acc.digest().stateXor};
        std::uint64_t server[3] = {local[0], local[1], local[2]};
        MPI_Bcast(server, 3, MPI_UINT64_T, 0, MPI_COMM_WORLD);

        int ok = (local[0] == server[0] && local[1] == server[1] && local[2] == server[2]) ? 1 : 0;
        int allOk = 0;
        MPI_Allreduce(&ok, &allOk, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

        if (rank == 0)
        {
            std::cout << "cube_demo window=[" << window[0] << "," << window[1] << "] hash=" << server[1] << "\n";
            if (p.verify)
            {
                if (!allOk)
                {
                    std::cerr << "cube_demo verify failed: client diverged from server\n";
                }
                else
                {
                    std::cout << "cube_demo ok\n";
                }
            }
        }
        MPI_Barrier(MPI_COMM_WORLD);
        return (p.verify && !allOk) ? 1 : 0;
    }
#endif
}

int main(int argc, char **argv)
{
#if defined(TICKBACK_HAS_MPI)
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_SINGLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
#else
    const int rank = 0;
    const int size = 1;
#endif

    const Params p = parse_args(argc, argv, rank);
    const tickback::ScopedLogLevel logLevel(p.logLevel);

    int rc = 0;
#if defined(TICKBACK_HAS_MPI)
    if (size == 2)
    {
        rc = run_mpi(p, rank);
    }
    else if (size == 1)
#endif
    {
        rc = run_loopback(p);
    }
#if defined(TICKBACK_HAS_MPI)
    else
    {
        usage_and_exit(rank);
    }
    MPI_Finalize();
#else
    (void)size;
#endif
    return rc;
}
