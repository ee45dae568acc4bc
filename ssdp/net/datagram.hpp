#pragma once

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ssdp
{

/// Ethernet MAC address, network byte order.
using HardwareAddress = std::array<std::uint8_t, 6>;

/// Format as "aa:bb:cc:dd:ee:ff".
std::string to_string(const HardwareAddress& address);

/**
 * @brief A UDP payload as handed up by a transport.
 *
 * The sender's hardware address is only known when the datagram was read from a link-layer socket.
 */
struct ReceivedDatagram
{
    std::string payload;
    boost::asio::ip::udp::endpoint sender;
    std::optional<HardwareAddress> sender_hardware_address;
};

/**
 * @brief A UDP payload to be sent by a transport.
 *
 * @c spoofed_source and @c destination_hardware_address are only honoured by link-layer transports;
 * the multicast transport always sends from its own bound address.
 */
struct OutgoingDatagram
{
    std::string payload;
    boost::asio::ip::udp::endpoint destination;
    std::optional<HardwareAddress> destination_hardware_address;
    std::optional<boost::asio::ip::address_v4> spoofed_source;
};

} // namespace ssdp
