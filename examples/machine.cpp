#include "config.hpp"
#include "machine.hpp"

#include <signal.h>
#include <time.h>

#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace
{
    // Waits for SIGINT/SIGTERM (blocked in every thread) and turns them into a
    // cooperative stop of the event loop.
    class SignalWatcher
    {
    public:
        explicit SignalWatcher(scalemodel::Machine &machine)
        {
            sigemptyset(&m_set);
            sigaddset(&m_set, SIGINT);
            sigaddset(&m_set, SIGTERM);
            m_thread = std::thread([this, &machine]
                                   {
                const timespec poll{0, 100 * 1000 * 1000};
                while (!m_done.load())
                {
                    if (sigtimedwait(&m_set, nullptr, &poll) > 0)
                    {
                        machine.request_stop();
                        return;
                    }
                } });
        }

        ~SignalWatcher()
        {
            m_done.store(true);
            m_thread.join();
        }

        static void block_in_process()
        {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            pthread_sigmask(SIG_BLOCK, &set, nullptr);
        }

    private:
        sigset_t m_set{};
        std::atomic<bool> m_done{false};
        std::thread m_thread;
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
        try
        {
            std::string tmp(s);
            size_t idx = 0;
            out = std::stod(tmp, &idx);
            return idx == tmp.size();
        }
        catch (const std::logic_error &)
        {
            return false;
        }
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Lamport-clocked cluster machine\n"
                  << "  --id N                 machine id (required)\n"
                  << "  --host ADDR            listen address (default 127.0.0.1)\n"
                  << "  --port P               listen port (required)\n"
                  << "  --peers H:P,H:P        other machines\n"
                  << "  --run-time SECONDS     run duration (default 60)\n"
                  << "  --ticks N              fixed ticks per second (default: random)\n"
                  << "  --max-ticks N          upper bound for the random rate (default 6)\n"
                  << "  --internal-prob P      probability of an internal step (default 0.7)\n"
                  << "  --seed S               action seed (default: nondeterministic)\n"
                  << "  --connect-attempts N   outbound connect attempts (default 5)\n"
                  << "  --connect-backoff-ms N delay between attempts (default 1000)\n"
                  << "  --log-dir DIR          where machine_<id>.log goes (default .)\n"
                  << "  --log-level LEVEL      error|warn|info|debug|trace|off (default warn)\n";
        std::exit(2);
    }

    scalemodel::MachineConfig parse_args(int argc, char **argv)
    {
        scalemodel::MachineConfig cfg;
        bool haveId = false;
        bool havePort = false;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--id")
            {
                if (!parse_u32(need(), cfg.id))
                    usage_and_exit();
                haveId = true;
            }
            else if (a == "--host")
            {
                cfg.host = std::string(need());
            }
            else if (a == "--port")
            {
                if (!scalemodel::parse_port(need(), cfg.port))
                    usage_and_exit();
                havePort = true;
            }
            else if (a == "--peers")
            {
                try
                {
                    cfg.peers = scalemodel::parse_peer_list(need());
                }
                catch (const std::invalid_argument &e)
                {
                    std::cerr << e.what() << "\n";
                    usage_and_exit();
                }
            }
            else if (a == "--run-time")
            {
                double seconds = 0.0;
                if (!parse_double(need(), seconds) || seconds < 0.0)
                    usage_and_exit();
                cfg.runTime = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
            }
            else if (a == "--ticks")
            {
                if (!parse_u32(need(), cfg.ticksPerSecond))
                    usage_and_exit();
            }
            else if (a == "--max-ticks")
            {
                if (!parse_u32(need(), cfg.maxTicksPerSecond))
                    usage_and_exit();
            }
            else if (a == "--internal-prob")
            {
                if (!parse_double(need(), cfg.internalProbability))
                    usage_and_exit();
            }
            else if (a == "--seed")
            {
                if (!parse_u64(need(), cfg.seed))
                    usage_and_exit();
            }
            else if (a == "--connect-attempts")
            {
                if (!parse_u32(need(), cfg.connectRetry.maxAttempts))
                    usage_and_exit();
            }
            else if (a == "--connect-backoff-ms")
            {
                std::uint64_t ms = 0;
                if (!parse_u64(need(), ms))
                    usage_and_exit();
                cfg.connectRetry.backoff = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
            }
            else if (a == "--log-dir")
            {
                cfg.logDir = std::string(need());
            }
            else if (a == "--log-level")
            {
                auto lvl = scalemodel::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                cfg.logLevel = *lvl;
            }
            else
            {
                usage_and_exit();
            }
        }

        if (!haveId || !havePort)
        {
            usage_and_exit();
        }

        try
        {
            scalemodel::validate_config(cfg);
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << e.what() << "\n";
            usage_and_exit();
        }
        return cfg;
    }
}

int main(int argc, char **argv)
{
    const scalemodel::MachineConfig cfg = parse_args(argc, argv);

    // Before any thread exists, so every thread inherits the mask.
    SignalWatcher::block_in_process();

    try
    {
        scalemodel::Machine machine(cfg);
        {
            SignalWatcher watcher(machine);
            machine.run();
        }

        const auto &s = machine.stats();
        std::cout << "Machine " << cfg.id << " finished: L=" << machine.clock()
                  << " ticks=" << s.ticks
                  << " received=" << s.receiveEvents
                  << " sent=" << s.messagesSent
                  << " internal=" << s.internalEvents << "\n";
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "machine " << cfg.id << ": fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
