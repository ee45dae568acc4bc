#pragma once

#include "ssdp/protocol/ssdp_constants.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ssdp
{

enum class TransportMode
{
    automatic, ///< Multicast socket, falling back to spoofing if it cannot be opened
    multicast,
    spoofing
};

inline const char* to_string(TransportMode mode) noexcept
{
    switch (mode)
    {
    case TransportMode::automatic:
        return "auto";
    case TransportMode::multicast:
        return "multicast";
    case TransportMode::spoofing:
        return "spoofing";
    }
    return "unknown";
}

inline std::optional<TransportMode> transport_mode_from_string(const std::string& text)
{
    if (text == "auto")
    {
        return TransportMode::automatic;
    }
    if (text == "multicast")
    {
        return TransportMode::multicast;
    }
    if (text == "spoofing")
    {
        return TransportMode::spoofing;
    }
    return std::nullopt;
}

struct NetworkConfig
{
    std::string multicast_address = protocol::multicast_address;
    unsigned short port           = protocol::port;
    std::size_t buffer_size       = 4096;
    TransportMode transport_mode  = TransportMode::automatic;

    /// Interface the spoofing transport injects frames on.
    std::string interface_name = "eth0";
    /// Local interface address used to join the multicast group.
    std::string interface_address = "0.0.0.0";

    int multicast_ttl = 2;
    int spoofed_ttl   = 15;

    /// Identity assumed after the raw socket has been opened as root.
    std::string user  = "nobody";
    std::string group = "nogroup";
};

} // namespace ssdp
