/*
Purpose: Resource-error handling for the listening socket.

What this tests: binding a port that is already in use, or an unparseable
address, throws std::runtime_error; a Machine whose listen port is taken fails
init() with an exception, records nothing, and still releases cleanly.
*/

#include "event_log.hpp"
#include "listener.hpp"
#include "machine.hpp"

#include <cassert>
#include <memory>
#include <stdexcept>

namespace
{
    template <class Fn>
    void expect_runtime_error(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }
}

int main()
{
    scalemodel::Logger::instance().set_level(scalemodel::LogLevel::Off);

    scalemodel::InboundQueue q;
    scalemodel::Listener first(q, 1);
    first.start("127.0.0.1", 0);
    const std::uint16_t taken = first.port();

    {
        scalemodel::Listener second(q, 2);
        expect_runtime_error([&]
                             { second.start("127.0.0.1", taken); });
        assert(!second.running());
    }

    {
        scalemodel::Listener bad(q, 3);
        expect_runtime_error([&]
                             { bad.start("not-an-address", 0); });
    }

    expect_runtime_error([&]
                         { first.start("127.0.0.1", 0); });

    {
        scalemodel::MachineConfig cfg;
        cfg.id = 9;
        cfg.port = taken;
        cfg.runTime = std::chrono::milliseconds(100);
        cfg.logLevel = scalemodel::LogLevel::Off;

        auto sink = std::make_shared<scalemodel::MemoryRecordSink>();
        {
            scalemodel::Machine m(cfg, sink);
            expect_runtime_error([&]
                                 { m.init(); });
            assert(m.state() == scalemodel::MachineState::Initializing);
            expect_runtime_error([&]
                                 { m.run(); });
        }
        assert(sink->records().empty());
        assert(sink->closed());
    }

    first.stop();
    return 0;
}
