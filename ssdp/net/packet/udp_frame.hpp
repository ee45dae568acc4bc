#pragma once

#include "ssdp/net/datagram.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ssdp
{

constexpr std::size_t ethernet_header_size = 14;
constexpr std::size_t ipv4_header_size     = 20;
constexpr std::size_t udp_header_size      = 8;

constexpr std::uint16_t ethertype_ipv4     = 0x0800;
constexpr std::uint8_t ip_protocol_udp     = 17;
constexpr std::size_t max_udp_payload_size = 0xFFFF - ipv4_header_size - udp_header_size;

/// Everything needed to address a hand-built Ethernet/IPv4/UDP frame.
struct UdpFrameAddressing
{
    HardwareAddress source_hardware_address {};
    HardwareAddress destination_hardware_address {};
    boost::asio::ip::address_v4 source_address;
    boost::asio::ip::address_v4 destination_address;
    std::uint16_t source_port      = 0;
    std::uint16_t destination_port = 0;
    std::uint8_t ttl               = 64;
    std::uint16_t identification   = 0;
};

/// A UDP datagram pulled out of an Ethernet frame.
struct ParsedUdpFrame
{
    HardwareAddress source_hardware_address {};
    HardwareAddress destination_hardware_address {};
    boost::asio::ip::udp::endpoint source;
    boost::asio::ip::udp::endpoint destination;
    std::string payload;
};

/**
 * @brief RFC 1071 internet checksum over @p data, continuing from a partial @p sum.
 *
 * Pass the result of a previous call as @p sum to checksum discontiguous buffers; only the last buffer
 * may have an odd length.
 */
std::uint32_t checksum_accumulate(const std::uint8_t* data, std::size_t length, std::uint32_t sum = 0);

/// Fold a 32 bit accumulator into the final ones' complement checksum.
std::uint16_t checksum_finish(std::uint32_t sum);

/**
 * @brief Build an IPv4 packet carrying a UDP datagram, checksums filled in.
 * @throws std::length_error if @p payload does not fit in one IPv4 packet.
 */
std::vector<std::uint8_t> assemble_udp_packet(const UdpFrameAddressing& addressing, const std::string& payload);

/// assemble_udp_packet() preceded by an Ethernet II header.
std::vector<std::uint8_t> assemble_ethernet_frame(const UdpFrameAddressing& addressing, const std::string& payload);

/**
 * @brief Extract the UDP datagram from an Ethernet/IPv4 frame.
 * @return std::nullopt for anything that is not a complete, unfragmented IPv4 UDP frame.
 */
std::optional<ParsedUdpFrame> parse_ethernet_frame(const std::uint8_t* data, std::size_t size);

/// Ethernet address an IPv4 multicast group maps to (01:00:5e + low 23 bits of the group).
HardwareAddress multicast_hardware_address(const boost::asio::ip::address_v4& group);

} // namespace ssdp
