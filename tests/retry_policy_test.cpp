/*
Purpose: Tests for the outbound connect policy.

What this tests: RetryPolicy computes constant and growing delays, and
PeerLink::connect against a port nobody listens on makes exactly maxAttempts
attempts, waits between them (not after the last), and reports the peer as
unreachable by returning null.
*/

#include "peer_link.hpp"
#include "retry_policy.hpp"
#include "socket.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>

int main()
{
    using namespace std::chrono_literals;

    {
        scalemodel::RetryPolicy p;
        assert(p.maxAttempts == 5);
        assert(p.delay_after(1) == 1000ms);
        assert(p.delay_after(4) == 1000ms);
    }
    {
        scalemodel::RetryPolicy p;
        p.backoff = 100ms;
        p.backoffMultiplier = 2.0;
        assert(p.delay_after(1) == 100ms);
        assert(p.delay_after(2) == 200ms);
        assert(p.delay_after(3) == 400ms);
    }

    scalemodel::Logger::instance().set_level(scalemodel::LogLevel::Off);

    // Grab an ephemeral port, then release it so connects are refused.
    std::uint16_t deadPort = 0;
    {
        scalemodel::Socket s = scalemodel::listen_tcp("127.0.0.1", 0);
        deadPort = scalemodel::local_port(s);
    }
    const scalemodel::PeerIdentity dead{"127.0.0.1", deadPort, 0};

    {
        scalemodel::RetryPolicy p;
        p.maxAttempts = 3;
        p.backoff = 30ms;

        std::uint32_t attempts = 0;
        const auto start = std::chrono::steady_clock::now();
        auto link = scalemodel::PeerLink::connect(dead, p, /*self=*/1, &attempts);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        assert(!link);
        assert(attempts == 3);
        // Two waits between three attempts.
        assert(elapsed >= 60ms);
    }

    {
        scalemodel::RetryPolicy p;
        p.maxAttempts = 1;
        p.backoff = 5000ms;

        std::uint32_t attempts = 0;
        const auto start = std::chrono::steady_clock::now();
        auto link = scalemodel::PeerLink::connect(dead, p, /*self=*/1, &attempts);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        assert(!link);
        assert(attempts == 1);
        // No wait after the final attempt.
        assert(elapsed < 2000ms);
    }

    return 0;
}
