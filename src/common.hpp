#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace scalemodel
{
    using LamportTime = std::uint64_t;
    using MachineId = std::uint32_t;

    // Address of one other machine, fixed for the lifetime of the process.
    struct PeerIdentity
    {
        std::string host;
        std::uint16_t port = 0;
        // Position in the configured peer list.
        std::size_t ordinal = 0;

        std::string to_string() const { return host + ":" + std::to_string(port); }
    };

    using PeerList = std::vector<PeerIdentity>;
}
