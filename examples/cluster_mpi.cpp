// One machine per MPI rank:
//   mpiexec -n 3 cluster_mpi [--run-time S] [--host ADDR] [--log-dir DIR] [--seed S]
// MPI only bootstraps the cluster (address exchange, start barrier) and sums the
// totals at the end. Lamport traffic goes over TCP between the ranks.

#include "config.hpp"
#include "machine.hpp"
#include "mpi_collectives.hpp"

#include <mpi.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
    struct Params
    {
        double runTime = 10.0;
        std::string host = "127.0.0.1";
        std::string logDir = ".";
        std::uint64_t seed = 0;
    };

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "cluster_mpi\n"
                      << "  --run-time SECONDS\n"
                      << "  --host ADDR\n"
                      << "  --log-dir DIR\n"
                      << "  --seed S\n";
        }
        MPI_Abort(MPI_COMM_WORLD, 2);
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

            if (a == "--run-time")
            {
                try
                {
                    p.runTime = std::stod(std::string(need()));
                }
                catch (const std::logic_error &)
                {
                    usage_and_exit(rank);
                }
            }
            else if (a == "--host")
            {
                p.host = std::string(need());
            }
            else if (a == "--log-dir")
            {
                p.logDir = std::string(need());
            }
            else if (a == "--seed")
            {
                const std::string_view s = need();
                auto r = std::from_chars(s.data(), s.data() + s.size(), p.seed);
                if (r.ec != std::errc() || r.ptr != s.data() + s.size())
                    usage_and_exit(rank);
            }
            else
            {
                usage_and_exit(rank);
            }
        }
        if (p.runTime < 0.0)
        {
            usage_and_exit(rank);
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const Params p = parse_args(argc, argv, rank);

    int exitCode = 0;
    try
    {
        scalemodel::MachineConfig cfg;
        cfg.id = static_cast<scalemodel::MachineId>(rank + 1);
        cfg.host = p.host;
        cfg.port = 0;
        cfg.runTime = std::chrono::milliseconds(static_cast<std::int64_t>(p.runTime * 1000.0));
        cfg.seed = p.seed;
        cfg.logDir = p.logDir;
        scalemodel::validate_config(cfg);

        scalemodel::Machine machine(cfg);
        const std::uint16_t port = machine.bind();

        scalemodel::PeerList all = scalemodel::mpi_allgather_addresses(MPI_COMM_WORLD, cfg.host, port);
        scalemodel::PeerList peers;
        for (auto &peer : all)
        {
            if (peer.ordinal != static_cast<std::size_t>(rank))
            {
                peers.push_back(std::move(peer));
            }
        }
        machine.set_peers(std::move(peers));

        MPI_Barrier(MPI_COMM_WORLD);
        machine.run();

        const auto &s = machine.stats();
        const std::uint64_t sent = scalemodel::mpi_allreduce_sum_u64(MPI_COMM_WORLD, s.messagesSent);
        const std::uint64_t received = scalemodel::mpi_allreduce_sum_u64(MPI_COMM_WORLD, s.receiveEvents);
        const std::uint64_t maxClock = scalemodel::mpi_allreduce_max_u64(MPI_COMM_WORLD, machine.clock());

        if (rank == 0)
        {
            std::cout << "cluster of " << size << ": sent=" << sent << " received=" << received
                      << " in-flight-at-shutdown=" << (sent - received) << " max L=" << maxClock << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "rank " << rank << ": " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
        exitCode = 1;
    }

    MPI_Finalize();
    return exitCode;
}
