#pragma once

#include "common.hpp"

#include <cstdint>
#include <random>

namespace scalemodel
{
    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    // Small stateful generator for the event loop. A fixed seed gives a
    // reproducible action sequence (tests, replays); seed 0 asks for a
    // nondeterministic one.
    class SplitMix64
    {
    public:
        explicit SplitMix64(std::uint64_t seed = 0)
        {
            if (seed == 0)
            {
                std::random_device rd;
                seed = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
            }
            m_state = seed;
        }

        std::uint64_t next_u64() noexcept
        {
            m_state += 0x9e3779b97f4a7c15ULL;
            std::uint64_t z = m_state;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            return z ^ (z >> 31);
        }

        // Uniform in [0,1).
        double unit_double() noexcept
        {
            const std::uint64_t mantissa = next_u64() >> 11;                   // 53 bits
            return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
        }

        // Uniform integer in [lo, hi] (inclusive). Undefined if lo > hi.
        std::uint64_t uniform_range(std::uint64_t lo, std::uint64_t hi) noexcept
        {
            const std::uint64_t span = (hi - lo) + 1;
            if (span == 0)
            {
                return next_u64();
            }
            // Modulo bias is negligible for the small spans used here.
            return lo + (next_u64() % span);
        }

    private:
        std::uint64_t m_state = 0;
    };
}
