#pragma once

#include "common.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace scalemodel
{
    inline std::string errno_string(int err)
    {
        return std::string(std::strerror(err));
    }

    // Owning TCP socket handle. Move-only; closes on destruction.
    class Socket
    {
    public:
        Socket() = default;
        explicit Socket(int fd) : m_fd(fd) {}

        ~Socket() { close(); }

        Socket(const Socket &) = delete;
        Socket &operator=(const Socket &) = delete;

        Socket(Socket &&o) noexcept : m_fd(std::exchange(o.m_fd, -1)) {}
        Socket &operator=(Socket &&o) noexcept
        {
            if (this != &o)
            {
                close();
                m_fd = std::exchange(o.m_fd, -1);
            }
            return *this;
        }

        bool valid() const noexcept { return m_fd >= 0; }
        int fd() const noexcept { return m_fd; }

        // Wakes any thread blocked in accept/recv on this socket without
        // releasing the descriptor.
        void shutdown_both() noexcept
        {
            if (m_fd >= 0)
            {
                ::shutdown(m_fd, SHUT_RDWR);
            }
        }

        void close() noexcept
        {
            if (m_fd >= 0)
            {
                ::close(m_fd);
                m_fd = -1;
            }
        }

        // Writes all of `data`. Returns 0 on success, otherwise the errno value.
        int send_all(const char *data, std::size_t n) noexcept
        {
            std::size_t off = 0;
            while (off < n)
            {
                const ssize_t w = ::send(m_fd, data + off, n - off, MSG_NOSIGNAL);
                if (w < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return errno;
                }
                off += static_cast<std::size_t>(w);
            }
            return 0;
        }

        // Blocking read. Returns bytes read, 0 on orderly EOF, -1 on error (errno set).
        ssize_t recv_some(char *buf, std::size_t n) noexcept
        {
            for (;;)
            {
                const ssize_t r = ::recv(m_fd, buf, n, 0);
                if (r < 0 && errno == EINTR)
                {
                    continue;
                }
                return r;
            }
        }

    private:
        int m_fd = -1;
    };

    // Resolves host:port and attempts one blocking TCP connect. Throws
    // std::runtime_error describing the failure.
    inline Socket connect_tcp(const std::string &host, std::uint16_t port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *res = nullptr;
        const std::string service = std::to_string(port);
        const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
        if (gai != 0)
        {
            throw std::runtime_error("connect_tcp: cannot resolve " + host + ": " + ::gai_strerror(gai));
        }

        int lastErr = 0;
        Socket out;
        for (addrinfo *ai = res; ai; ai = ai->ai_next)
        {
            Socket s(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
            if (!s.valid())
            {
                lastErr = errno;
                continue;
            }
            if (::connect(s.fd(), ai->ai_addr, ai->ai_addrlen) == 0)
            {
                out = std::move(s);
                break;
            }
            lastErr = errno;
        }
        ::freeaddrinfo(res);

        if (!out.valid())
        {
            throw std::runtime_error("connect_tcp: " + host + ":" + service + ": " + errno_string(lastErr));
        }

        // Records are tiny; send each immediately.
        const int one = 1;
        ::setsockopt(out.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return out;
    }

    // Binds and listens on host:port (IPv4). Port 0 picks an ephemeral port.
    // Throws std::runtime_error on any failure.
    inline Socket listen_tcp(const std::string &host, std::uint16_t port, int backlog = 16)
    {
        Socket s(::socket(AF_INET, SOCK_STREAM, 0));
        if (!s.valid())
        {
            throw std::runtime_error("listen_tcp: socket(): " + errno_string(errno));
        }

        const int one = 1;
        ::setsockopt(s.fd(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (host.empty() || host == "0.0.0.0")
        {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        }
        else if (host == "localhost")
        {
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        }
        else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
        {
            throw std::runtime_error("listen_tcp: invalid IPv4 address '" + host + "'");
        }

        if (::bind(s.fd(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            throw std::runtime_error("listen_tcp: bind " + host + ":" + std::to_string(port) + ": " + errno_string(errno));
        }
        if (::listen(s.fd(), backlog) < 0)
        {
            throw std::runtime_error("listen_tcp: listen: " + errno_string(errno));
        }
        return s;
    }

    inline std::uint16_t local_port(const Socket &s)
    {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(s.fd(), reinterpret_cast<sockaddr *>(&addr), &len) < 0)
        {
            throw std::runtime_error("local_port: getsockname: " + errno_string(errno));
        }
        return ntohs(addr.sin_port);
    }
}
