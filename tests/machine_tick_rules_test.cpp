/*
Purpose: Event-loop rules of a single machine, driven tick by tick.

What this tests: INIT is recorded at L=0 with the chosen tick rate; internal
steps advance the clock by one; a queued message always wins over local
activity and merges with max(L, t) + 1, recording the post-pop queue length;
queued messages are consumed in arrival order regardless of their values; a
send action with no reachable peer is recorded as INTERNAL with a note; the
whole trace passes check_trace.
*/

#include "event_log.hpp"
#include "machine.hpp"
#include "trace_check.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace
{
    struct Harness
    {
        std::shared_ptr<scalemodel::MemoryRecordSink> sink = std::make_shared<scalemodel::MemoryRecordSink>();
        std::unique_ptr<scalemodel::Machine> machine;

        explicit Harness(double internalProbability)
        {
            scalemodel::MachineConfig cfg;
            cfg.id = 1;
            cfg.port = 0;
            cfg.ticksPerSecond = 10;
            cfg.internalProbability = internalProbability;
            cfg.seed = 42;
            cfg.logLevel = scalemodel::LogLevel::Off;
            machine = std::make_unique<scalemodel::Machine>(cfg, sink);
            machine->init();
        }

        scalemodel::EventRecord tick()
        {
            machine->tick();
            return sink->records().back();
        }

        void advance_to(scalemodel::LamportTime target)
        {
            while (machine->clock() < target)
            {
                const auto r = tick();
                assert(r.type == scalemodel::EventType::Internal);
            }
            assert(machine->clock() == target);
        }
    };
}

int main()
{
    using scalemodel::EventType;

    // INIT and three local events.
    {
        Harness h(/*internalProbability=*/1.0);
        assert(h.machine->state() == scalemodel::MachineState::Running);
        assert(h.machine->ticks_per_second() == 10);

        const auto recs = h.sink->records();
        assert(recs.size() == 1);
        assert(recs[0].type == EventType::Init);
        assert(recs[0].logicalClock == 0);
        assert(recs[0].note == std::string("ticks=10"));

        for (scalemodel::LamportTime expect = 1; expect <= 3; ++expect)
        {
            const auto r = h.tick();
            assert(r.type == EventType::Internal);
            assert(r.logicalClock == expect);
            assert(!r.queueLength.has_value());
            assert(!r.note.has_value());
        }
        assert(h.machine->clock() == 3);
        assert(h.machine->stats().internalEvents == 3);
    }

    // Receive from a clock ahead: 5 and 9 -> 10.
    {
        Harness h(1.0);
        h.advance_to(5);
        h.machine->inbound().push({9, 2});
        const auto r = h.tick();
        assert(r.type == EventType::Receive);
        assert(r.logicalClock == 10);
        assert(r.queueLength == std::size_t{0});
    }

    // Receive from a clock behind: 5 and 2 -> 6.
    {
        Harness h(1.0);
        h.advance_to(5);
        h.machine->inbound().push({2, 3});
        const auto r = h.tick();
        assert(r.type == EventType::Receive);
        assert(r.logicalClock == 6);
    }

    // Arrival order, not numeric order: [7, 3] -> L=8 then L=9.
    {
        Harness h(1.0);
        h.machine->inbound().push({7, 2});
        h.machine->inbound().push({3, 3});

        auto r = h.tick();
        assert(r.type == EventType::Receive);
        assert(r.logicalClock == 8);
        assert(r.queueLength == std::size_t{1});

        r = h.tick();
        assert(r.type == EventType::Receive);
        assert(r.logicalClock == 9);
        assert(r.queueLength == std::size_t{0});

        r = h.tick();
        assert(r.type == EventType::Internal);
        assert(r.logicalClock == 10);
        assert(h.machine->stats().receiveEvents == 2);
    }

    // Draining has priority over local activity for as long as the queue is non-empty.
    {
        Harness h(0.0);
        for (scalemodel::LamportTime t = 1; t <= 5; ++t)
        {
            h.machine->inbound().push({t, 2});
        }
        for (int i = 0; i < 5; ++i)
        {
            const auto r = h.tick();
            assert(r.type == EventType::Receive);
            assert(r.queueLength == std::size_t(4 - i));
        }
        assert(!h.machine->inbound().has_pending());
    }

    // Send actions without any peer degrade to annotated internal steps.
    {
        Harness h(0.0);
        assert(h.machine->active_peer_count() == 0);
        for (scalemodel::LamportTime expect = 1; expect <= 20; ++expect)
        {
            const auto r = h.tick();
            assert(r.type == EventType::Internal);
            assert(r.logicalClock == expect);
            assert(r.note.has_value());
            assert(r.note->rfind("no active peers for SEND(", 0) == 0);
        }
        assert(h.machine->stats().sendEvents == 0);
        assert(h.machine->stats().messagesSent == 0);
    }

    // Mixed run: the recorded trace obeys every clock rule.
    {
        Harness h(0.7);
        for (int i = 0; i < 200; ++i)
        {
            if (i % 3 == 0)
            {
                h.machine->inbound().push({static_cast<scalemodel::LamportTime>(i * 2), 4});
            }
            h.machine->tick();
        }
        h.machine->shutdown();

        const auto recs = h.sink->records();
        assert(recs.size() == 202);
        assert(recs.back().type == EventType::Shutdown);
        assert(scalemodel::check_trace(recs).empty());

        for (std::size_t i = 1; i < recs.size() - 1; ++i)
        {
            assert(recs[i].logicalClock > recs[i - 1].logicalClock);
        }
    }

    return 0;
}
