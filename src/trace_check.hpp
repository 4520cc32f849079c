#pragma once

#include "event_log.hpp"

#include <string>
#include <vector>

namespace scalemodel
{
    // Checks one machine's record sequence against the clock rules that can be
    // verified from the trace alone:
    // - INIT first (if present at all) and SHUTDOWN last, each at most once
    // - logical clock strictly increasing across events
    // - SEND(k)/INTERNAL advance the clock by exactly one
    // - RECEIVE carries a queue length, nothing else does
    // Returns one message per violation; empty means the trace is consistent.
    inline std::vector<std::string> check_trace(const std::vector<EventRecord> &trace)
    {
        std::vector<std::string> out;
        auto violation = [&](std::size_t i, const std::string &what)
        {
            out.push_back("record " + std::to_string(i) + " (" + event_type_name(trace[i].type) + ", L=" +
                          std::to_string(trace[i].logicalClock) + "): " + what);
        };

        std::size_t inits = 0;
        std::size_t shutdowns = 0;
        for (std::size_t i = 0; i < trace.size(); ++i)
        {
            const EventRecord &r = trace[i];

            if (r.type == EventType::Init)
            {
                ++inits;
                if (i != 0)
                {
                    violation(i, "INIT is not the first record");
                }
            }
            if (r.type == EventType::Shutdown)
            {
                ++shutdowns;
                if (i + 1 != trace.size())
                {
                    violation(i, "SHUTDOWN is not the last record");
                }
            }

            if (r.queueLength.has_value() != (r.type == EventType::Receive))
            {
                violation(i, "queue= must appear exactly on RECEIVE");
            }

            if (i == 0)
            {
                continue;
            }
            const LamportTime prev = trace[i - 1].logicalClock;

            if (is_local_event(r.type) && r.logicalClock != prev + 1)
            {
                violation(i, "local event must advance the clock by one (previous L=" + std::to_string(prev) + ")");
            }
            else if (r.type == EventType::Receive && r.logicalClock <= prev)
            {
                violation(i, "receive must move the clock past previous L=" + std::to_string(prev));
            }
            else if (r.type == EventType::Shutdown && r.logicalClock != prev)
            {
                violation(i, "SHUTDOWN must not change the clock");
            }
        }

        if (inits > 1)
        {
            out.push_back("trace has " + std::to_string(inits) + " INIT records");
        }
        if (shutdowns > 1)
        {
            out.push_back("trace has " + std::to_string(shutdowns) + " SHUTDOWN records");
        }
        return out;
    }
}
