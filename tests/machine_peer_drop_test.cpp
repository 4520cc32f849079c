/*
Purpose: A peer that goes away is dropped from the active set.

What this tests: after A shuts down, B's sends to it start failing; the link is
closed and pruned (droppedPeers == 1), the run continues, and later send
actions are recorded as INTERNAL with a "no active peers" note.
*/

#include "machine.hpp"
#include "trace_check.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

int main()
{
    using namespace std::chrono_literals;
    using scalemodel::EventType;
    scalemodel::Logger::instance().set_level(scalemodel::LogLevel::Off);

    scalemodel::MachineConfig ca;
    ca.id = 1;
    ca.port = 0;
    ca.ticksPerSecond = 1;
    ca.logLevel = scalemodel::LogLevel::Off;
    auto sinkA = std::make_shared<scalemodel::MemoryRecordSink>();
    scalemodel::Machine a(ca, sinkA);
    a.init();

    scalemodel::MachineConfig cb;
    cb.id = 2;
    cb.port = 0;
    cb.ticksPerSecond = 1;
    cb.internalProbability = 0.0;
    cb.seed = 5;
    cb.peers.push_back(scalemodel::PeerIdentity{"127.0.0.1", a.listen_port(), 0});
    cb.logLevel = scalemodel::LogLevel::Off;
    auto sinkB = std::make_shared<scalemodel::MemoryRecordSink>();
    scalemodel::Machine b(cb, sinkB);
    b.init();
    assert(b.active_peer_count() == 1);

    b.tick();
    assert(b.stats().messagesSent == 1);

    a.shutdown();

    for (int i = 0; i < 200 && b.active_peer_count() != 0; ++i)
    {
        b.tick();
        std::this_thread::sleep_for(10ms);
    }
    assert(b.active_peer_count() == 0);
    assert(b.stats().droppedPeers == 1);
    assert(b.stats().sendFailures >= 1);
    assert(b.state() == scalemodel::MachineState::Running);

    b.tick();
    const auto recs = sinkB->records();
    assert(recs.back().type == EventType::Internal);
    assert(recs.back().note.has_value());
    assert(recs.back().note->rfind("no active peers for SEND(", 0) == 0);

    b.shutdown();
    assert(scalemodel::check_trace(sinkB->records()).empty());
    return 0;
}
