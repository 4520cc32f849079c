#pragma once

#include "inbound_queue.hpp"
#include "log.hpp"
#include "retry_policy.hpp"
#include "socket.hpp"
#include "wire.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace scalemodel
{
    // Outbound, send-only connection to one peer. Written only by the event
    // loop thread, so it carries no lock.
    class PeerLink
    {
    public:
        PeerLink(PeerIdentity peer, Socket sock, MachineId self)
            : m_peer(std::move(peer)), m_sock(std::move(sock)), m_self(self)
        {
            if (!m_sock.valid())
            {
                throw std::runtime_error("PeerLink: invalid socket");
            }
        }

        // Dials `peer` following `policy`. Returns nullptr when every attempt
        // failed; the peer is then considered unreachable for the run.
        static std::unique_ptr<PeerLink> connect(const PeerIdentity &peer,
                                                 const RetryPolicy &policy,
                                                 MachineId self,
                                                 std::uint32_t *attemptsUsed = nullptr)
        {
            const std::uint32_t maxAttempts = policy.maxAttempts == 0 ? 1 : policy.maxAttempts;
            for (std::uint32_t attempt = 1; attempt <= maxAttempts; ++attempt)
            {
                if (attemptsUsed)
                {
                    *attemptsUsed = attempt;
                }
                try
                {
                    Socket s = connect_tcp(peer.host, peer.port);
                    Logger::instance().logf(LogLevel::Info, self, "connected to peer %s on attempt %u",
                                            peer.to_string().c_str(), static_cast<unsigned>(attempt));
                    return std::make_unique<PeerLink>(peer, std::move(s), self);
                }
                catch (const std::runtime_error &e)
                {
                    Logger::instance().logf(LogLevel::Warn, self, "attempt %u/%u to reach %s failed: %s",
                                            static_cast<unsigned>(attempt), static_cast<unsigned>(maxAttempts),
                                            peer.to_string().c_str(), e.what());
                }
                if (attempt < maxAttempts)
                {
                    std::this_thread::sleep_for(policy.delay_after(attempt));
                }
            }

            Logger::instance().logf(LogLevel::Warn, self, "peer %s unreachable; excluded for this run",
                                    peer.to_string().c_str());
            return nullptr;
        }

        const PeerIdentity &peer() const noexcept { return m_peer; }

        bool is_open() const noexcept { return m_sock.valid(); }

        // One record, one write. On failure the link closes itself and returns
        // false; the caller drops it from the active set.
        bool send(LamportTime timestamp, MachineId senderId)
        {
            if (!m_sock.valid())
            {
                return false;
            }
            const std::string rec = encode_message(timestamp, senderId);
            const int err = m_sock.send_all(rec.data(), rec.size());
            if (err != 0)
            {
                Logger::instance().logf(LogLevel::Warn, m_self, "send to %s failed: %s; closing link",
                                        m_peer.to_string().c_str(), errno_string(err).c_str());
                m_sock.close();
                return false;
            }
            ++m_sent;
            return true;
        }

        std::uint64_t sent() const noexcept { return m_sent; }

        void close() noexcept { m_sock.close(); }

    private:
        PeerIdentity m_peer;
        Socket m_sock;
        MachineId m_self = 0;
        std::uint64_t m_sent = 0;
    };

    // Blocking read loop for one inbound connection. Every complete record is
    // pushed onto `queue`; malformed records are dropped with a warning. Returns
    // on EOF, read error, or when another thread shuts the socket down.
    inline void receive_loop(Socket &sock, InboundQueue &queue, MachineId self)
    {
        FrameDecoder decoder;
        char buf[1024];

        for (;;)
        {
            const ssize_t n = sock.recv_some(buf, sizeof(buf));
            if (n == 0)
            {
                Logger::instance().logf(LogLevel::Debug, self, "inbound connection closed by peer");
                break;
            }
            if (n < 0)
            {
                Logger::instance().logf(LogLevel::Debug, self, "inbound read ended: %s", errno_string(errno).c_str());
                break;
            }

            decoder.feed(buf, static_cast<std::size_t>(n));
            for (;;)
            {
                try
                {
                    auto rec = decoder.next();
                    if (!rec)
                    {
                        break;
                    }
                    const WireMessage msg = decode_message(*rec);
                    queue.push(InboundMessage{msg.timestamp, msg.senderId});
                }
                catch (const WireError &e)
                {
                    Logger::instance().logf(LogLevel::Warn, self, "dropping malformed record: %s", e.what());
                }
            }
        }

        if (decoder.buffered() > 0)
        {
            Logger::instance().logf(LogLevel::Warn, self, "discarding %zu bytes of incomplete record at close",
                                    decoder.buffered());
        }
        sock.shutdown_both();
    }
}
