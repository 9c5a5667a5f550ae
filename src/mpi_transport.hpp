#pragma once

#include "transport.hpp"
#include "wire.hpp"

#include <mpi.h>

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tickback
{
    // Point-to-point transport over MPI. The peer id of a process is its rank in
    // `comm`, so the authoritative server is normally rank 0.
    class MpiTransport final : public ITransport
    {
    public:
        explicit MpiTransport(MPI_Comm comm = MPI_COMM_WORLD, int tag = 0)
            : m_comm(comm), m_tag(tag)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiTransport: null communicator");
            }
            int rank = 0;
            if (MPI_Comm_rank(m_comm, &rank) != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiTransport: MPI_Comm_rank failed");
            }
            m_self = static_cast<PeerId>(rank);
        }

        ~MpiTransport() override
        {
            // Outstanding sends must complete before their buffers are released.
            for (auto &p : m_pendingSends)
            {
                MPI_Wait(&p.req, MPI_STATUS_IGNORE);
            }
        }

        MpiTransport(const MpiTransport &) = delete;
        MpiTransport &operator=(const MpiTransport &) = delete;

        PeerId self() const noexcept { return m_self; }

        void send(WireMessage msg) override
        {
            drain_completed_sends_();

            msg.src = m_self;

            PendingSend pending;
            pending.buf = encode_envelope_(msg);
            pending.req = MPI_REQUEST_NULL;

            const int rc = MPI_Isend(pending.buf.data(), static_cast<int>(pending.buf.size()), MPI_BYTE,
                                     static_cast<int>(msg.dst), m_tag, m_comm, &pending.req);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiTransport: MPI_Isend failed");
            }
            m_pendingSends.push_back(std::move(pending));
        }

        std::optional<WireMessage> poll() override
        {
            drain_completed_sends_();

            MPI_Status status;
            int flag = 0;
            int rc = MPI_Iprobe(MPI_ANY_SOURCE, m_tag, m_comm, &flag, &status);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiTransport: MPI_Iprobe failed");
            }
            if (!flag)
            {
                return std::nullopt;
            }

            int count = 0;
            rc = MPI_Get_count(&status, MPI_BYTE, &count);
            if (rc != MPI_SUCCESS || count <= 0)
            {
                throw std::runtime_error("MpiTransport: MPI_Get_count failed");
            }

            ByteBuffer buf(static_cast<std::size_t>(count));
            rc = MPI_Recv(buf.data(), count, MPI_BYTE, status.MPI_SOURCE, status.MPI_TAG, m_comm, MPI_STATUS_IGNORE);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiTransport: MPI_Recv failed");
            }

            return decode_envelope_(std::span<const std::byte>(buf.data(), buf.size()));
        }

        bool has_pending() const override
        {
            drain_completed_sends_();

            MPI_Status status;
            int flag = 0;
            if (MPI_Iprobe(MPI_ANY_SOURCE, m_tag, m_comm, &flag, &status) != MPI_SUCCESS)
            {
                return false;
            }
            return flag != 0 || !m_pendingSends.empty();
        }

    private:
        struct PendingSend
        {
            ByteBuffer buf;
            MPI_Request req = MPI_REQUEST_NULL;
        };

        static ByteBuffer encode_envelope_(const WireMessage &msg)
        {
            // Envelope adds a fixed 21-byte header in front of the payload.
            WireWriter w(msg.bytes.size() + 32);
            w.write_u8(static_cast<std::uint8_t>(msg.kind));
            w.write_u32(msg.src);
            w.write_u32(msg.dst);
            w.write_u64(msg.entity);
            w.write_bytes(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
            return w.take();
        }

        static WireMessage decode_envelope_(std::span<const std::byte> bytes)
        {
            WireReader r(bytes);
            WireMessage out;
            out.kind = static_cast<MessageKind>(r.read_u8());
            out.src = r.read_u32();
            out.dst = r.read_u32();
            out.entity = r.read_u64();
            const auto payload = r.read_bytes();
            out.bytes.assign(payload.begin(), payload.end());
            return out;
        }

        void drain_completed_sends_() const
        {
            for (std::size_t i = 0; i < m_pendingSends.size();)
            {
                int done = 0;
                const int rc = MPI_Test(&m_pendingSends[i].req, &done, MPI_STATUS_IGNORE);
                if (rc != MPI_SUCCESS)
                {
                    throw std::runtime_error("MpiTransport: MPI_Test failed");
                }
                if (done)
                {
                    m_pendingSends[i] = std::move(m_pendingSends.back());
                    m_pendingSends.pop_back();
                    continue;
                }
                ++i;
            }
        }

        MPI_Comm m_comm;
        int m_tag = 0;
        PeerId m_self = 0;

        // Mutable because has_pending() is logically const but still advances
        // completion of in-flight nonblocking sends.
        mutable std::vector<PendingSend> m_pendingSends;
    };
}
