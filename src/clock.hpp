#pragma once

#include "common.hpp"

#include <algorithm>

namespace scalemodel
{
    // Lamport logical clock.
    //
    // Owned by the Machine and mutated only from its event loop thread, so the
    // counter is a plain integer. Receive loops never touch it; they enqueue.
    class LamportClock
    {
    public:
        LamportTime value() const noexcept { return m_value; }

        void reset() noexcept { m_value = 0; }

        // Local event (send or internal step).
        LamportTime tick_local() noexcept
        {
            return ++m_value;
        }

        // Consumed inbound message: max(local, remote) + 1.
        LamportTime tick_receive(LamportTime remote) noexcept
        {
            m_value = std::max(m_value, remote) + 1;
            return m_value;
        }

    private:
        LamportTime m_value = 0;
    };
}
