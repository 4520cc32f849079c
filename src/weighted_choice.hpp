#pragma once

#include "common.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace scalemodel
{
    // Enumerated outcomes with integer weights. A draw in [1, total_weight()]
    // selects the outcome whose cumulative range contains it, so the mapping is
    // testable independently of where the draw comes from.
    template <class T>
    class WeightedChoice
    {
    public:
        void add(T outcome, std::uint32_t weight)
        {
            if (weight == 0)
            {
                return;
            }
            m_total += weight;
            m_entries.push_back(Entry{std::move(outcome), m_total});
        }

        std::uint64_t total_weight() const noexcept { return m_total; }

        bool empty() const noexcept { return m_entries.empty(); }

        const T &pick(std::uint64_t draw) const
        {
            if (m_entries.empty())
            {
                throw std::runtime_error("WeightedChoice: no outcomes");
            }
            if (draw < 1 || draw > m_total)
            {
                throw std::out_of_range("WeightedChoice: draw outside [1, total_weight]");
            }
            for (const auto &e : m_entries)
            {
                if (draw <= e.cumulative)
                {
                    return e.outcome;
                }
            }
            return m_entries.back().outcome;
        }

        // Probability of `outcome`, for auditing a configured distribution.
        double probability(const T &outcome) const
        {
            if (m_total == 0)
            {
                return 0.0;
            }
            std::uint64_t prev = 0;
            std::uint64_t hits = 0;
            for (const auto &e : m_entries)
            {
                if (e.outcome == outcome)
                {
                    hits += e.cumulative - prev;
                }
                prev = e.cumulative;
            }
            return static_cast<double>(hits) / static_cast<double>(m_total);
        }

    private:
        struct Entry
        {
            T outcome;
            std::uint64_t cumulative = 0;
        };

        std::vector<Entry> m_entries;
        std::uint64_t m_total = 0;
    };
}
