#pragma once

#include <chrono>
#include <cstdint>

namespace scalemodel
{
    // Outbound connect policy. Applied once per peer during INIT; a peer that
    // exhausts its attempts is not dialled again for the rest of the run.
    struct RetryPolicy
    {
        std::uint32_t maxAttempts = 5;
        std::chrono::milliseconds backoff{1000};
        // Growth factor applied to the delay after each failed attempt.
        // 1.0 keeps the delay constant.
        double backoffMultiplier = 1.0;

        // Delay to wait after failed attempt number `attempt` (1-based).
        std::chrono::milliseconds delay_after(std::uint32_t attempt) const
        {
            double d = static_cast<double>(backoff.count());
            for (std::uint32_t i = 1; i < attempt; ++i)
            {
                d *= backoffMultiplier;
            }
            return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(d));
        }
    };
}
