#pragma once

#include "common.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scalemodel
{
    // Peer-to-peer record: ASCII "<lamportTimestamp>:<senderId>\n".
    // One send produces exactly one record; the newline is the record boundary.

    inline constexpr char kRecordDelimiter = '\n';

    // Longest accepted record body (without the delimiter). Two 20-digit
    // integers and a colon fit comfortably.
    inline constexpr std::size_t kMaxRecordLength = 64;

    class WireError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct WireMessage
    {
        LamportTime timestamp = 0;
        MachineId senderId = 0;
    };

    inline std::string encode_message(LamportTime timestamp, MachineId senderId)
    {
        std::string out = std::to_string(timestamp);
        out.push_back(':');
        out += std::to_string(senderId);
        out.push_back(kRecordDelimiter);
        return out;
    }

    namespace detail
    {
        template <class T>
        bool parse_unsigned(std::string_view s, T &out)
        {
            if (s.empty())
            {
                return false;
            }
            auto r = std::from_chars(s.data(), s.data() + s.size(), out);
            return r.ec == std::errc() && r.ptr == s.data() + s.size();
        }
    }

    // Parses one record body (delimiter already stripped). Throws WireError.
    inline WireMessage decode_message(std::string_view record)
    {
        const auto colon = record.find(':');
        if (colon == std::string_view::npos)
        {
            throw WireError("decode_message: missing ':' separator");
        }

        WireMessage out;
        if (!detail::parse_unsigned(record.substr(0, colon), out.timestamp))
        {
            throw WireError("decode_message: bad timestamp field");
        }
        if (!detail::parse_unsigned(record.substr(colon + 1), out.senderId))
        {
            throw WireError("decode_message: bad sender id field");
        }
        return out;
    }

    // Reassembles newline-delimited records from arbitrary stream chunks.
    class FrameDecoder
    {
    public:
        void feed(const char *data, std::size_t n) { m_buf.append(data, n); }

        // Returns the next complete record body, or nullopt if more bytes are
        // needed. Throws WireError when the pending fragment exceeds
        // kMaxRecordLength without a delimiter; the fragment is discarded first.
        std::optional<std::string> next()
        {
            const auto pos = m_buf.find(kRecordDelimiter);
            if (pos == std::string::npos)
            {
                if (m_buf.size() > kMaxRecordLength)
                {
                    const std::size_t dropped = m_buf.size();
                    m_buf.clear();
                    throw WireError("FrameDecoder: unterminated record of " + std::to_string(dropped) + " bytes dropped");
                }
                return std::nullopt;
            }

            std::string record = m_buf.substr(0, pos);
            m_buf.erase(0, pos + 1);
            return record;
        }

        std::size_t buffered() const noexcept { return m_buf.size(); }

    private:
        std::string m_buf;
    };
}
