#pragma once

#include "common.hpp"

#include <mpi.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace scalemodel
{
    // MPI helpers for launching one machine per rank. MPI is used only for
    // bootstrap (address exchange, start barrier) and end-of-run totals; the
    // machines themselves talk over TCP.

    inline constexpr std::size_t kMpiHostLen = 64;

    // Every rank contributes its listen address; returns them indexed by rank.
    // Ordinals are the rank numbers.
    inline PeerList mpi_allgather_addresses(MPI_Comm comm, const std::string &host, std::uint16_t port)
    {
        if (host.size() >= kMpiHostLen)
        {
            throw std::runtime_error("mpi_allgather_addresses: host name too long");
        }

        int size = 0;
        MPI_Comm_size(comm, &size);

        char localHost[kMpiHostLen] = {};
        std::memcpy(localHost, host.data(), host.size());
        std::vector<char> hosts(static_cast<std::size_t>(size) * kMpiHostLen);
        int rc = MPI_Allgather(localHost, static_cast<int>(kMpiHostLen), MPI_CHAR,
                               hosts.data(), static_cast<int>(kMpiHostLen), MPI_CHAR, comm);
        if (rc != MPI_SUCCESS)
        {
            throw std::runtime_error("mpi_allgather_addresses: MPI_Allgather(host) failed");
        }

        const std::uint32_t localPort = port;
        std::vector<std::uint32_t> ports(static_cast<std::size_t>(size));
        rc = MPI_Allgather(&localPort, 1, MPI_UINT32_T, ports.data(), 1, MPI_UINT32_T, comm);
        if (rc != MPI_SUCCESS)
        {
            throw std::runtime_error("mpi_allgather_addresses: MPI_Allgather(port) failed");
        }

        PeerList out;
        for (int r = 0; r < size; ++r)
        {
            const char *h = hosts.data() + static_cast<std::size_t>(r) * kMpiHostLen;
            out.push_back(PeerIdentity{std::string(h, ::strnlen(h, kMpiHostLen)),
                                       static_cast<std::uint16_t>(ports[static_cast<std::size_t>(r)]),
                                       static_cast<std::size_t>(r)});
        }
        return out;
    }

    // Allreduce sum for u64 counters.
    inline std::uint64_t mpi_allreduce_sum_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_SUM, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 5);
        }
        return out;
    }

    // Allreduce max, e.g. for the highest final Lamport clock.
    inline std::uint64_t mpi_allreduce_max_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_MAX, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 6);
        }
        return out;
    }

    // Allreduce logical-AND, for "every rank passed its local checks".
    inline bool mpi_allreduce_all(MPI_Comm comm, bool localOk)
    {
        int in = localOk ? 1 : 0;
        int out = 0;
        const int rc = MPI_Allreduce(&in, &out, 1, MPI_INT, MPI_LAND, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 4);
        }
        return out != 0;
    }
}
