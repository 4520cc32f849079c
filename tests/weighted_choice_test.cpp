/*
Purpose: Unit tests for the idle-tick action distribution.

What this tests: WeightedChoice maps each draw in [1, total] to the outcome
owning that cumulative range and rejects draws outside it; the default action
table reproduces the 1..10 split (three send actions at 10% each, internal at
70%); extreme probabilities produce send-only and internal-only tables; a Machine
uses the table for its configured probability.
*/

#include "machine.hpp"
#include "weighted_choice.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>

namespace
{
    bool near(double a, double b)
    {
        return std::fabs(a - b) < 1e-9;
    }

    template <class Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);
    }
}

int main()
{
    using scalemodel::Action;

    {
        scalemodel::WeightedChoice<char> w;
        assert(w.empty());
        expect_throw([&]
                     { (void)w.pick(1); });

        w.add('a', 1);
        w.add('b', 0); // ignored
        w.add('c', 3);
        assert(w.total_weight() == 4);
        assert(w.pick(1) == 'a');
        assert(w.pick(2) == 'c');
        assert(w.pick(4) == 'c');
        assert(near(w.probability('a'), 0.25));
        assert(near(w.probability('b'), 0.0));
        assert(near(w.probability('c'), 0.75));
        expect_throw([&]
                     { (void)w.pick(0); });
        expect_throw([&]
                     { (void)w.pick(5); });
    }

    // Default table.
    {
        const auto t = scalemodel::make_action_table(0.7);
        assert(t.total_weight() == scalemodel::kActionWeightResolution);
        assert(near(t.probability(Action::SendOne), 0.1));
        assert(near(t.probability(Action::SendOther), 0.1));
        assert(near(t.probability(Action::SendAll), 0.1));
        assert(near(t.probability(Action::Internal), 0.7));

        // Draw 1..100 -> SEND(1), 101..200 -> SEND(2), 201..300 -> SEND(3), rest internal.
        assert(t.pick(1) == Action::SendOne);
        assert(t.pick(100) == Action::SendOne);
        assert(t.pick(101) == Action::SendOther);
        assert(t.pick(201) == Action::SendAll);
        assert(t.pick(300) == Action::SendAll);
        assert(t.pick(301) == Action::Internal);
        assert(t.pick(1000) == Action::Internal);

        std::map<Action, std::uint64_t> counts;
        for (std::uint64_t d = 1; d <= t.total_weight(); ++d)
        {
            ++counts[t.pick(d)];
        }
        assert(counts[Action::SendOne] == 100);
        assert(counts[Action::SendOther] == 100);
        assert(counts[Action::SendAll] == 100);
        assert(counts[Action::Internal] == 700);
    }

    {
        const auto sendOnly = scalemodel::make_action_table(0.0);
        assert(near(sendOnly.probability(Action::Internal), 0.0));
        assert(near(sendOnly.probability(Action::SendOne) + sendOnly.probability(Action::SendOther) +
                        sendOnly.probability(Action::SendAll),
                    1.0));

        const auto internalOnly = scalemodel::make_action_table(1.0);
        assert(near(internalOnly.probability(Action::Internal), 1.0));
        assert(internalOnly.pick(1) == Action::Internal);
    }

    // A machine builds its table from the configured probability.
    {
        scalemodel::MachineConfig cfg;
        cfg.id = 1;
        cfg.internalProbability = 0.4;
        cfg.logLevel = scalemodel::LogLevel::Off;
        scalemodel::Machine m(cfg, std::make_shared<scalemodel::MemoryRecordSink>());
        const auto &t = m.action_table();
        assert(t.total_weight() == scalemodel::kActionWeightResolution);
        assert(near(t.probability(Action::Internal), 0.4));
        assert(near(t.probability(Action::SendOne), 0.2));
        assert(near(t.probability(Action::SendAll), 0.2));
    }

    expect_throw([]
                 { (void)scalemodel::make_action_table(1.5); });
    expect_throw([]
                 { (void)scalemodel::make_action_table(-0.1); });

    // The generator stays inside the requested inclusive range.
    {
        scalemodel::SplitMix64 rng(1234);
        for (int i = 0; i < 10000; ++i)
        {
            const auto v = rng.uniform_range(1, 10);
            assert(v >= 1 && v <= 10);
            const double u = rng.unit_double();
            assert(u >= 0.0 && u < 1.0);
        }

        scalemodel::SplitMix64 a(99);
        scalemodel::SplitMix64 b(99);
        for (int i = 0; i < 100; ++i)
        {
            assert(a.next_u64() == b.next_u64());
        }
    }

    return 0;
}
