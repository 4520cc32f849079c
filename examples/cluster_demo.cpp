// Three machines in one process, each on its own thread, talking over loopback
// TCP. Each writes machine_<id>.log into the working directory (or argv[1]).

#include "config.hpp"
#include "machine.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char **argv)
{
    constexpr std::uint32_t kMachines = 3;
    const std::string logDir = argc > 1 ? argv[1] : ".";

    try
    {
        const double seconds = argc > 2 ? std::stod(argv[2]) : 10.0;
        if (seconds < 0.0)
        {
            throw std::invalid_argument("run time must be non-negative");
        }

        std::vector<std::unique_ptr<scalemodel::Machine>> machines;
        std::vector<std::uint16_t> ports;
        for (std::uint32_t i = 0; i < kMachines; ++i)
        {
            scalemodel::MachineConfig cfg;
            cfg.id = i + 1;
            cfg.host = "127.0.0.1";
            cfg.port = 0;
            cfg.runTime = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
            cfg.logDir = logDir;
            cfg.logLevel = scalemodel::LogLevel::Info;
            cfg.connectRetry.maxAttempts = 3;
            cfg.connectRetry.backoff = std::chrono::milliseconds(200);

            machines.push_back(std::make_unique<scalemodel::Machine>(cfg));
            ports.push_back(machines.back()->bind());
        }

        // Full mesh: everyone dials everyone else.
        for (std::uint32_t i = 0; i < kMachines; ++i)
        {
            scalemodel::PeerList peers;
            for (std::uint32_t j = 0; j < kMachines; ++j)
            {
                if (j == i)
                {
                    continue;
                }
                peers.push_back(scalemodel::PeerIdentity{"127.0.0.1", ports[j], peers.size()});
            }
            machines[i]->set_peers(std::move(peers));
        }

        std::vector<std::thread> threads;
        for (auto &m : machines)
        {
            threads.emplace_back([&m]
                                 {
                try
                {
                    m->run();
                }
                catch (const std::runtime_error &e)
                {
                    std::cerr << "machine " << m->config().id << " failed: " << e.what() << "\n";
                } });
        }
        for (auto &t : threads)
        {
            t.join();
        }

        for (const auto &m : machines)
        {
            const auto &s = m->stats();
            std::cout << "machine " << m->config().id
                      << " ticks/s=" << m->ticks_per_second()
                      << " L=" << m->clock()
                      << " received=" << s.receiveEvents
                      << " sent=" << s.messagesSent
                      << " internal=" << s.internalEvents << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "cluster_demo: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
