#pragma once

#include "common.hpp"

#include <deque>
#include <mutex>
#include <optional>

namespace scalemodel
{
    struct InboundMessage
    {
        LamportTime senderTimestamp = 0;
        MachineId senderId = 0;
    };

    // Unbounded FIFO between the receive loops (producers) and the event loop
    // (single consumer). Order is arrival order; no ordering across producers.
    class InboundQueue
    {
    public:
        void push(InboundMessage msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_queue.push_back(msg);
        }

        // Pops the oldest message. `remaining` receives the length after the pop,
        // taken under the same lock.
        std::optional<InboundMessage> poll(std::size_t *remaining = nullptr)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            InboundMessage out = m_queue.front();
            m_queue.pop_front();
            if (remaining)
            {
                *remaining = m_queue.size();
            }
            return out;
        }

        bool has_pending() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return !m_queue.empty();
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

    private:
        mutable std::mutex m_mu;
        std::deque<InboundMessage> m_queue;
    };
}
