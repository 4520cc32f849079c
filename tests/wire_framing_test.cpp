/*
Purpose: Tests for the newline-framed "ts:id" peer protocol.

What this tests: encoding produces exactly one delimited record, the frame
decoder reassembles records split across reads and splits records coalesced
into one read, malformed record bodies are rejected with WireError, and an
over-long unterminated fragment is discarded without poisoning later records.
*/

#include "wire.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace
{
    template <typename Fn>
    void expect_wire_error(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const scalemodel::WireError &)
        {
            threw = true;
        }
        assert(threw);
    }

    void feed(scalemodel::FrameDecoder &d, const std::string &s)
    {
        d.feed(s.data(), s.size());
    }
}

int main()
{
    assert(scalemodel::encode_message(17, 2) == "17:2\n");
    assert(scalemodel::encode_message(0, 0) == "0:0\n");

    {
        const auto m = scalemodel::decode_message("17:2");
        assert(m.timestamp == 17);
        assert(m.senderId == 2);
    }
    {
        const auto m = scalemodel::decode_message("18446744073709551615:4294967295");
        assert(m.timestamp == 18446744073709551615ULL);
        assert(m.senderId == 4294967295U);
    }

    expect_wire_error([]
                      { (void)scalemodel::decode_message(""); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("17"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message(":2"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("17:"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("-1:2"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("17:2:3"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("abc:2"); });
    expect_wire_error([]
                      { (void)scalemodel::decode_message("99999999999999999999:1"); });

    // Split across reads.
    {
        scalemodel::FrameDecoder d;
        feed(d, "12");
        assert(!d.next().has_value());
        feed(d, "3:");
        assert(!d.next().has_value());
        feed(d, "4\n");
        auto r = d.next();
        assert(r.has_value());
        assert(*r == "123:4");
        assert(!d.next().has_value());
        assert(d.buffered() == 0);
    }

    // Coalesced into one read, with a trailing partial.
    {
        scalemodel::FrameDecoder d;
        feed(d, "1:1\n2:1\n3:");
        std::vector<std::string> got;
        while (auto r = d.next())
        {
            got.push_back(*r);
        }
        assert((got == std::vector<std::string>{"1:1", "2:1"}));
        assert(d.buffered() == 2);
        feed(d, "1\n");
        auto r = d.next();
        assert(r.has_value() && *r == "3:1");
    }

    // Over-long fragment is dropped, the stream recovers at the next record.
    {
        scalemodel::FrameDecoder d;
        feed(d, std::string(scalemodel::kMaxRecordLength + 1, '9'));
        expect_wire_error([&]
                          { (void)d.next(); });
        assert(d.buffered() == 0);
        feed(d, "5:3\n");
        auto r = d.next();
        assert(r.has_value() && *r == "5:3");
    }

    // Every encoded record decodes back through the framer.
    {
        scalemodel::FrameDecoder d;
        const std::string bytes = scalemodel::encode_message(42, 7) + scalemodel::encode_message(43, 7);
        feed(d, bytes);
        const auto a = scalemodel::decode_message(*d.next());
        const auto b = scalemodel::decode_message(*d.next());
        assert(a.timestamp == 42 && a.senderId == 7);
        assert(b.timestamp == 43 && b.senderId == 7);
    }

    return 0;
}
