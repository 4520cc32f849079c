#pragma once

#include "common.hpp"
#include "log.hpp"
#include "retry_policy.hpp"

#include <charconv>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scalemodel
{
    struct MachineConfig
    {
        MachineId id = 0;

        // Listening address for inbound peer connections. Port 0 binds an
        // ephemeral port (tests, in-process clusters).
        std::string host = "127.0.0.1";
        std::uint16_t port = 0;

        // Other machines in the cluster. An entry equal to host:port is skipped.
        PeerList peers;

        // Event loop run time; the only cancellation besides request_stop().
        std::chrono::milliseconds runTime{60000};

        // Fixed tick rate. 0 picks a uniform rate in [1, maxTicksPerSecond] at INIT.
        std::uint32_t ticksPerSecond = 0;
        std::uint32_t maxTicksPerSecond = 6;

        // Probability that an idle tick is an internal step rather than a send.
        // The remainder is split evenly across SEND(1), SEND(2) and SEND(3);
        // 0.7 reproduces the classic 1..10 draw (1,2,3 send; 4..10 internal).
        double internalProbability = 0.7;

        // Seed for the action/tick-rate generator. 0 means nondeterministic.
        std::uint64_t seed = 0;

        RetryPolicy connectRetry{};

        // Directory for machine_<id>.log when the machine opens its own sink.
        std::string logDir = ".";

        LogLevel logLevel = LogLevel::Warn;
    };

    inline bool parse_port(std::string_view s, std::uint16_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (s.empty() || r.ec != std::errc() || r.ptr != s.data() + s.size() || v > 65535)
        {
            return false;
        }
        out = static_cast<std::uint16_t>(v);
        return true;
    }

    // "host1:port1,host2:port2,..." -> PeerList with ordinals in list order.
    // Whitespace around entries is ignored; an empty string gives an empty list.
    inline PeerList parse_peer_list(std::string_view s)
    {
        auto trim = [](std::string_view v)
        {
            while (!v.empty() && (v.front() == ' ' || v.front() == '\t'))
            {
                v.remove_prefix(1);
            }
            while (!v.empty() && (v.back() == ' ' || v.back() == '\t'))
            {
                v.remove_suffix(1);
            }
            return v;
        };

        PeerList out;
        if (trim(s).empty())
        {
            return out;
        }

        std::size_t start = 0;
        for (;;)
        {
            const auto comma = s.find(',', start);
            const std::string_view entry = trim(s.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));

            const auto colon = entry.rfind(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                throw std::invalid_argument("parse_peer_list: expected host:port, got '" + std::string(entry) + "'");
            }
            PeerIdentity p;
            p.host = std::string(entry.substr(0, colon));
            if (!parse_port(entry.substr(colon + 1), p.port) || p.port == 0)
            {
                throw std::invalid_argument("parse_peer_list: bad port in '" + std::string(entry) + "'");
            }
            p.ordinal = out.size();
            out.push_back(std::move(p));

            if (comma == std::string_view::npos)
            {
                break;
            }
            start = comma + 1;
        }
        return out;
    }

    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        static constexpr LogLevel all[] = {LogLevel::Error, LogLevel::Warn, LogLevel::Info,
                                           LogLevel::Debug, LogLevel::Trace, LogLevel::Off};
        for (LogLevel l : all)
        {
            std::string_view name = log_level_name(l);
            if (name.size() != s.size())
            {
                continue;
            }
            bool eq = true;
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                const char c = (s[i] >= 'a' && s[i] <= 'z') ? static_cast<char>(s[i] - 'a' + 'A') : s[i];
                if (c != name[i])
                {
                    eq = false;
                    break;
                }
            }
            if (eq)
            {
                return l;
            }
        }
        return std::nullopt;
    }

    inline bool is_self(const MachineConfig &cfg, const PeerIdentity &p)
    {
        if (p.port != cfg.port)
        {
            return false;
        }
        if (p.host == cfg.host)
        {
            return true;
        }
        auto loopback = [](const std::string &h)
        { return h == "localhost" || h == "127.0.0.1"; };
        return loopback(p.host) && loopback(cfg.host);
    }

    // Throws std::invalid_argument naming the first bad field.
    inline void validate_config(const MachineConfig &cfg)
    {
        if (cfg.host.empty())
        {
            throw std::invalid_argument("MachineConfig: host must not be empty");
        }
        if (cfg.runTime.count() < 0)
        {
            throw std::invalid_argument("MachineConfig: runTime must be non-negative");
        }
        if (cfg.ticksPerSecond == 0 && cfg.maxTicksPerSecond == 0)
        {
            throw std::invalid_argument("MachineConfig: maxTicksPerSecond must be >= 1 when ticksPerSecond is 0");
        }
        if (!(cfg.internalProbability >= 0.0 && cfg.internalProbability <= 1.0))
        {
            throw std::invalid_argument("MachineConfig: internalProbability must be in [0,1]");
        }
        if (cfg.connectRetry.maxAttempts == 0)
        {
            throw std::invalid_argument("MachineConfig: connectRetry.maxAttempts must be >= 1");
        }
        if (cfg.connectRetry.backoff.count() < 0 || cfg.connectRetry.backoffMultiplier < 1.0)
        {
            throw std::invalid_argument("MachineConfig: connectRetry backoff must be >= 0 with multiplier >= 1");
        }
        for (const auto &p : cfg.peers)
        {
            if (p.host.empty() || p.port == 0)
            {
                throw std::invalid_argument("MachineConfig: bad peer '" + p.to_string() + "'");
            }
        }
    }
}
