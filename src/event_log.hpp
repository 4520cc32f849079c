#pragma once

#include "common.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scalemodel
{
    enum class EventType : std::uint8_t
    {
        Init,
        Receive,
        SendOne,
        SendOther,
        SendAll,
        Internal,
        Shutdown,
    };

    inline const char *event_type_name(EventType t) noexcept
    {
        switch (t)
        {
        case EventType::Init:
            return "INIT";
        case EventType::Receive:
            return "RECEIVE";
        case EventType::SendOne:
            return "SEND(1)";
        case EventType::SendOther:
            return "SEND(2)";
        case EventType::SendAll:
            return "SEND(3)";
        case EventType::Internal:
            return "INTERNAL";
        case EventType::Shutdown:
            return "SHUTDOWN";
        }
        return "UNKNOWN";
    }

    inline std::optional<EventType> event_type_from_name(std::string_view s) noexcept
    {
        static constexpr EventType all[] = {EventType::Init, EventType::Receive, EventType::SendOne, EventType::SendOther,
                                            EventType::SendAll, EventType::Internal, EventType::Shutdown};
        for (EventType t : all)
        {
            if (s == event_type_name(t))
            {
                return t;
            }
        }
        return std::nullopt;
    }

    inline bool is_local_event(EventType t) noexcept
    {
        return t == EventType::SendOne || t == EventType::SendOther || t == EventType::SendAll || t == EventType::Internal;
    }

    struct EventRecord
    {
        double wallClockTime = 0.0;
        EventType type = EventType::Internal;
        LamportTime logicalClock = 0;
        std::optional<std::size_t> queueLength;
        std::optional<std::string> note;
    };

    inline double wall_clock_seconds()
    {
        using namespace std::chrono;
        return duration<double>(system_clock::now().time_since_epoch()).count();
    }

    // "<wallClockTime>, <eventType>, L=<clock>[, queue=<n>][, note=<text>]"
    inline std::string format_record(const EventRecord &r)
    {
        char head[64];
        std::snprintf(head, sizeof(head), "%.4f", r.wallClockTime);

        std::string out(head);
        out += ", ";
        out += event_type_name(r.type);
        out += ", L=";
        out += std::to_string(r.logicalClock);
        if (r.queueLength)
        {
            out += ", queue=";
            out += std::to_string(*r.queueLength);
        }
        if (r.note)
        {
            out += ", note=";
            out += *r.note;
        }
        return out;
    }

    // Inverse of format_record. The note is taken verbatim to end of line, so it
    // may itself contain ", ". Throws std::runtime_error on malformed lines.
    inline EventRecord parse_record(std::string_view line)
    {
        auto fail = [&](const char *why) -> std::runtime_error
        {
            return std::runtime_error(std::string("parse_record: ") + why + ": '" + std::string(line) + "'");
        };

        auto take_field = [](std::string_view &rest) -> std::string_view
        {
            const auto pos = rest.find(", ");
            std::string_view f = rest.substr(0, pos);
            rest = pos == std::string_view::npos ? std::string_view{} : rest.substr(pos + 2);
            return f;
        };

        EventRecord r;
        std::string_view rest = line;
        if (!rest.empty() && rest.back() == '\n')
        {
            rest.remove_suffix(1);
        }

        const std::string wall(take_field(rest));
        try
        {
            std::size_t idx = 0;
            r.wallClockTime = std::stod(wall, &idx);
            if (idx != wall.size())
            {
                throw fail("bad wall clock time");
            }
        }
        catch (const std::invalid_argument &)
        {
            throw fail("bad wall clock time");
        }
        catch (const std::out_of_range &)
        {
            throw fail("bad wall clock time");
        }

        const auto type = event_type_from_name(take_field(rest));
        if (!type)
        {
            throw fail("unknown event type");
        }
        r.type = *type;

        const std::string_view clock = take_field(rest);
        if (clock.substr(0, 2) != "L=")
        {
            throw fail("missing L= field");
        }
        const std::string_view digits = clock.substr(2);
        auto cr = std::from_chars(digits.data(), digits.data() + digits.size(), r.logicalClock);
        if (digits.empty() || cr.ec != std::errc() || cr.ptr != digits.data() + digits.size())
        {
            throw fail("bad logical clock");
        }

        if (rest.substr(0, 6) == "queue=")
        {
            const std::string_view q = take_field(rest).substr(6);
            std::size_t n = 0;
            auto qr = std::from_chars(q.data(), q.data() + q.size(), n);
            if (q.empty() || qr.ec != std::errc() || qr.ptr != q.data() + q.size())
            {
                throw fail("bad queue length");
            }
            r.queueLength = n;
        }

        if (rest.substr(0, 5) == "note=")
        {
            r.note = std::string(rest.substr(5));
            rest = {};
        }

        if (!rest.empty())
        {
            throw fail("unexpected trailing field");
        }
        return r;
    }

    // Append-only destination for a machine's event records.
    class IRecordSink
    {
    public:
        virtual ~IRecordSink() = default;
        virtual void write(const EventRecord &rec) = 0;
        virtual void close() = 0;
    };

    // One line per record, flushed immediately, to "<dir>/machine_<id>.log".
    class FileRecordSink final : public IRecordSink
    {
    public:
        explicit FileRecordSink(const std::string &path)
        {
            m_file = std::fopen(path.c_str(), "w");
            if (!m_file)
            {
                throw std::runtime_error("FileRecordSink: cannot open '" + path + "'");
            }
        }

        ~FileRecordSink() override { close(); }

        FileRecordSink(const FileRecordSink &) = delete;
        FileRecordSink &operator=(const FileRecordSink &) = delete;

        static std::string path_for(const std::string &dir, MachineId id)
        {
            std::string d = dir.empty() ? std::string(".") : dir;
            if (d.back() != '/')
            {
                d.push_back('/');
            }
            return d + "machine_" + std::to_string(id) + ".log";
        }

        void write(const EventRecord &rec) override
        {
            if (!m_file)
            {
                throw std::runtime_error("FileRecordSink: write after close");
            }
            const std::string line = format_record(rec);
            std::fprintf(m_file, "%s\n", line.c_str());
            std::fflush(m_file);
        }

        void close() override
        {
            if (m_file)
            {
                std::fclose(m_file);
                m_file = nullptr;
            }
        }

    private:
        FILE *m_file = nullptr;
    };

    // Keeps records in memory; used by tests and the in-process cluster demo.
    class MemoryRecordSink final : public IRecordSink
    {
    public:
        void write(const EventRecord &rec) override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_closed)
            {
                throw std::runtime_error("MemoryRecordSink: write after close");
            }
            m_records.push_back(rec);
        }

        void close() override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            ++m_closeCalls;
            m_closed = true;
        }

        std::vector<EventRecord> records() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_records;
        }

        bool closed() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_closed;
        }

        std::size_t close_calls() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_closeCalls;
        }

    private:
        mutable std::mutex m_mu;
        std::vector<EventRecord> m_records;
        bool m_closed = false;
        std::size_t m_closeCalls = 0;
    };
}
