#pragma once

#include "inbound_queue.hpp"
#include "log.hpp"
#include "peer_link.hpp"
#include "socket.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace scalemodel
{
    // Accepts inbound peer connections and runs one receive loop thread per
    // accepted socket, all feeding the same InboundQueue.
    class Listener
    {
    public:
        Listener(InboundQueue &queue, MachineId self) : m_queue(queue), m_self(self) {}

        ~Listener() { stop(); }

        Listener(const Listener &) = delete;
        Listener &operator=(const Listener &) = delete;

        // Binds and starts the accept thread. Throws std::runtime_error if the
        // address cannot be bound.
        void start(const std::string &host, std::uint16_t port)
        {
            if (m_running.load())
            {
                throw std::runtime_error("Listener: already started");
            }
            m_server = listen_tcp(host, port);
            m_port = local_port(m_server);
            m_stopping.store(false);
            m_running.store(true);
            m_acceptThread = std::thread([this]
                                         { accept_loop_(); });
            Logger::instance().logf(LogLevel::Info, m_self, "listening on %s:%u", host.c_str(), static_cast<unsigned>(m_port));
        }

        std::uint16_t port() const noexcept { return m_port; }

        bool running() const noexcept { return m_running.load(); }

        std::size_t connection_count() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_conns.size();
        }

        // Unblocks accept and every receive loop, then joins them. Safe to call
        // more than once.
        void stop()
        {
            if (!m_running.exchange(false))
            {
                return;
            }
            m_stopping.store(true);

            // shutdown() on a listening socket wakes a blocked accept() on Linux
            // only; BSD and macOS keep it blocked and the join below would hang.
            m_server.shutdown_both();
            if (m_acceptThread.joinable())
            {
                m_acceptThread.join();
            }
            m_server.close();

            std::list<Connection> conns;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                conns.swap(m_conns);
            }
            for (auto &c : conns)
            {
                c.sock->shutdown_both();
            }
            for (auto &c : conns)
            {
                if (c.thread.joinable())
                {
                    c.thread.join();
                }
            }
        }

    private:
        struct Connection
        {
            std::shared_ptr<Socket> sock;
            std::shared_ptr<std::atomic<bool>> done;
            std::thread thread;
        };

        void accept_loop_()
        {
            for (;;)
            {
                const int fd = ::accept(m_server.fd(), nullptr, nullptr);
                if (fd < 0)
                {
                    if (errno == EINTR || errno == ECONNABORTED)
                    {
                        continue;
                    }
                    if (!m_stopping.load())
                    {
                        Logger::instance().logf(LogLevel::Error, m_self, "accept failed: %s", errno_string(errno).c_str());
                    }
                    break;
                }

                if (m_stopping.load())
                {
                    ::close(fd);
                    break;
                }

                Connection c;
                c.sock = std::make_shared<Socket>(fd);
                c.done = std::make_shared<std::atomic<bool>>(false);
                c.thread = std::thread([this, sock = c.sock, done = c.done]
                                       {
                    receive_loop(*sock, m_queue, m_self);
                    done->store(true); });

                std::lock_guard<std::mutex> lk(m_mu);
                reap_finished_();
                m_conns.push_back(std::move(c));
                Logger::instance().logf(LogLevel::Debug, m_self, "accepted inbound connection (%zu active)", m_conns.size());
            }
        }

        // Joins receive threads that already returned. Caller holds m_mu.
        void reap_finished_()
        {
            for (auto it = m_conns.begin(); it != m_conns.end();)
            {
                if (it->done->load())
                {
                    if (it->thread.joinable())
                    {
                        it->thread.join();
                    }
                    it = m_conns.erase(it);
                    continue;
                }
                ++it;
            }
        }

        InboundQueue &m_queue;
        MachineId m_self = 0;

        Socket m_server;
        std::uint16_t m_port = 0;
        std::atomic<bool> m_running{false};
        std::atomic<bool> m_stopping{false};
        std::thread m_acceptThread;

        mutable std::mutex m_mu;
        std::list<Connection> m_conns;
    };
}
