#include "ssdp/net/packet/udp_frame.hpp"

#include <algorithm>
#include <stdexcept>

namespace ssdp
{

namespace
{

void put_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value)
{
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void put_bytes(std::vector<std::uint8_t>& buffer, const std::uint8_t* data, std::size_t length)
{
    buffer.insert(buffer.end(), data, data + length);
}

std::uint16_t get_uint16(const std::uint8_t* data)
{
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

boost::asio::ip::address_v4 get_address(const std::uint8_t* data)
{
    boost::asio::ip::address_v4::bytes_type bytes;
    std::copy(data, data + bytes.size(), bytes.begin());
    return boost::asio::ip::address_v4(bytes);
}

} // namespace

std::uint32_t checksum_accumulate(const std::uint8_t* data, std::size_t length, std::uint32_t sum)
{
    std::size_t index = 0;
    for (; index + 1 < length; index += 2)
    {
        sum += static_cast<std::uint32_t>((data[index] << 8) | data[index + 1]);
    }

    if (index < length)
    {
        sum += static_cast<std::uint32_t>(data[index] << 8);
    }

    return sum;
}

std::uint16_t checksum_finish(std::uint32_t sum)
{
    while ((sum >> 16) != 0)
    {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<std::uint16_t>(~sum & 0xFFFF);
}

std::vector<std::uint8_t> assemble_udp_packet(const UdpFrameAddressing& addressing, const std::string& payload)
{
    if (payload.size() > max_udp_payload_size)
    {
        throw std::length_error("UDP payload of " + std::to_string(payload.size()) + " bytes does not fit in an IPv4 packet");
    }

    const auto udp_length    = static_cast<std::uint16_t>(udp_header_size + payload.size());
    const auto total_length  = static_cast<std::uint16_t>(ipv4_header_size + udp_length);
    const auto source        = addressing.source_address.to_bytes();
    const auto destination   = addressing.destination_address.to_bytes();
    const auto* payload_data = reinterpret_cast<const std::uint8_t*>(payload.data());

    std::vector<std::uint8_t> packet;
    packet.reserve(total_length);

    // IPv4 header
    packet.push_back(0x45); // version 4, IHL 5
    packet.push_back(0x00); // DSCP/ECN
    put_uint16(packet, total_length);
    put_uint16(packet, addressing.identification);
    put_uint16(packet, 0x4000); // don't fragment
    packet.push_back(addressing.ttl);
    packet.push_back(ip_protocol_udp);
    put_uint16(packet, 0); // header checksum, filled below
    put_bytes(packet, source.data(), source.size());
    put_bytes(packet, destination.data(), destination.size());

    const std::uint16_t header_checksum = checksum_finish(checksum_accumulate(packet.data(), ipv4_header_size));
    packet[10]                          = static_cast<std::uint8_t>(header_checksum >> 8);
    packet[11]                          = static_cast<std::uint8_t>(header_checksum & 0xFF);

    // UDP header
    const std::size_t udp_offset = packet.size();
    put_uint16(packet, addressing.source_port);
    put_uint16(packet, addressing.destination_port);
    put_uint16(packet, udp_length);
    put_uint16(packet, 0); // checksum, filled below
    put_bytes(packet, payload_data, payload.size());

    // Pseudo header: source, destination, zero, protocol, UDP length
    std::vector<std::uint8_t> pseudo_header;
    pseudo_header.reserve(12);
    put_bytes(pseudo_header, source.data(), source.size());
    put_bytes(pseudo_header, destination.data(), destination.size());
    pseudo_header.push_back(0);
    pseudo_header.push_back(ip_protocol_udp);
    put_uint16(pseudo_header, udp_length);

    std::uint32_t sum          = checksum_accumulate(pseudo_header.data(), pseudo_header.size());
    sum                        = checksum_accumulate(packet.data() + udp_offset, udp_length, sum);
    std::uint16_t udp_checksum = checksum_finish(sum);
    if (udp_checksum == 0)
    {
        // zero means "no checksum" on the wire
        udp_checksum = 0xFFFF;
    }
    packet[udp_offset + 6] = static_cast<std::uint8_t>(udp_checksum >> 8);
    packet[udp_offset + 7] = static_cast<std::uint8_t>(udp_checksum & 0xFF);

    return packet;
}

std::vector<std::uint8_t> assemble_ethernet_frame(const UdpFrameAddressing& addressing, const std::string& payload)
{
    const std::vector<std::uint8_t> packet = assemble_udp_packet(addressing, payload);

    std::vector<std::uint8_t> frame;
    frame.reserve(ethernet_header_size + packet.size());
    put_bytes(frame, addressing.destination_hardware_address.data(), addressing.destination_hardware_address.size());
    put_bytes(frame, addressing.source_hardware_address.data(), addressing.source_hardware_address.size());
    put_uint16(frame, ethertype_ipv4);
    frame.insert(frame.end(), packet.begin(), packet.end());
    return frame;
}

std::optional<ParsedUdpFrame> parse_ethernet_frame(const std::uint8_t* data, std::size_t size)
{
    if (size < ethernet_header_size + ipv4_header_size + udp_header_size)
    {
        return std::nullopt;
    }
    if (get_uint16(data + 12) != ethertype_ipv4)
    {
        return std::nullopt;
    }

    const std::uint8_t* ip          = data + ethernet_header_size;
    const std::size_t ip_available  = size - ethernet_header_size;
    const std::size_t header_length = static_cast<std::size_t>(ip[0] & 0x0F) * 4;
    if ((ip[0] >> 4) != 4 || header_length < ipv4_header_size || header_length + udp_header_size > ip_available)
    {
        return std::nullopt;
    }

    // Ethernet pads short frames, trust the IP total length instead of the frame size
    const std::size_t total_length = get_uint16(ip + 2);
    if (total_length < header_length + udp_header_size || total_length > ip_available)
    {
        return std::nullopt;
    }
    if (ip[9] != ip_protocol_udp || (get_uint16(ip + 6) & 0x3FFF) != 0)
    {
        return std::nullopt;
    }

    const std::uint8_t* udp      = ip + header_length;
    const std::size_t udp_length = get_uint16(udp + 4);
    if (udp_length < udp_header_size || udp_length > total_length - header_length)
    {
        return std::nullopt;
    }

    ParsedUdpFrame parsed;
    std::copy(data, data + 6, parsed.destination_hardware_address.begin());
    std::copy(data + 6, data + 12, parsed.source_hardware_address.begin());
    parsed.source      = boost::asio::ip::udp::endpoint(get_address(ip + 12), get_uint16(udp));
    parsed.destination = boost::asio::ip::udp::endpoint(get_address(ip + 16), get_uint16(udp + 2));
    parsed.payload.assign(reinterpret_cast<const char*>(udp + udp_header_size), udp_length - udp_header_size);
    return parsed;
}

HardwareAddress multicast_hardware_address(const boost::asio::ip::address_v4& group)
{
    const auto bytes = group.to_bytes();
    return HardwareAddress {0x01, 0x00, 0x5e, static_cast<std::uint8_t>(bytes[1] & 0x7F), bytes[2], bytes[3]};
}

} // namespace ssdp
