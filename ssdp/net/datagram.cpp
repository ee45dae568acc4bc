#include "ssdp/net/datagram.hpp"

#include <cstdio>

namespace ssdp
{

std::string to_string(const HardwareAddress& address)
{
    char text[18];
    std::snprintf(text, sizeof(text), "%02x:%02x:%02x:%02x:%02x:%02x", address[0], address[1], address[2], address[3], address[4],
                  address[5]);
    return text;
}

} // namespace ssdp
