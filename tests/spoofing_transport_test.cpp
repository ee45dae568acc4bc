#include "ssdp/net/spoofing_transport.hpp"

#include <gtest/gtest.h>

namespace ssdp
{
namespace
{

using boost::asio::ip::make_address;
using boost::asio::ip::make_address_v4;

const HardwareAddress local_hardware_address {0x02, 0x00, 0x00, 0x00, 0x00, 0x01};
const HardwareAddress requester_hardware_address {0x02, 0x00, 0x00, 0x00, 0x00, 0x42};

OutgoingDatagram datagram_to(const std::string& address, unsigned short port)
{
    OutgoingDatagram datagram;
    datagram.payload        = "HTTP/1.1 200 OK\r\n\r\n";
    datagram.destination    = boost::asio::ip::udp::endpoint(make_address(address), port);
    datagram.spoofed_source = make_address_v4("192.168.1.20");
    return datagram;
}

TEST(FrameAddressingTest, RequiresSpoofedSource)
{
    auto datagram = datagram_to("239.255.255.250", 1900);
    datagram.spoofed_source.reset();

    EXPECT_FALSE(make_frame_addressing(datagram, local_hardware_address, 1900, 15).has_value());
}

TEST(FrameAddressingTest, RejectsIpv6Destination)
{
    auto datagram                         = datagram_to("ff02::c", 1900);
    datagram.destination_hardware_address = requester_hardware_address;

    EXPECT_FALSE(make_frame_addressing(datagram, local_hardware_address, 1900, 15).has_value());
}

TEST(FrameAddressingTest, UnicastWithoutHardwareAddressIsNotSent)
{
    const auto datagram = datagram_to("192.168.1.50", 50000);

    EXPECT_FALSE(make_frame_addressing(datagram, local_hardware_address, 1900, 15).has_value());
}

TEST(FrameAddressingTest, UnicastUsesRequesterHardwareAddress)
{
    auto datagram                         = datagram_to("192.168.1.50", 50000);
    datagram.destination_hardware_address = requester_hardware_address;

    const auto addressing = make_frame_addressing(datagram, local_hardware_address, 1900, 15);
    ASSERT_TRUE(addressing.has_value());
    EXPECT_EQ(addressing->destination_hardware_address, requester_hardware_address);
    EXPECT_EQ(addressing->source_hardware_address, local_hardware_address);
    EXPECT_EQ(addressing->source_address, make_address_v4("192.168.1.20"));
    EXPECT_EQ(addressing->destination_address, make_address_v4("192.168.1.50"));
    EXPECT_EQ(addressing->source_port, 1900);
    EXPECT_EQ(addressing->destination_port, 50000);
    EXPECT_EQ(addressing->ttl, 15);
}

TEST(FrameAddressingTest, MulticastUsesGroupHardwareAddress)
{
    auto datagram = datagram_to("239.255.255.250", 1900);
    // Ignored for group destinations
    datagram.destination_hardware_address = requester_hardware_address;

    const auto addressing = make_frame_addressing(datagram, local_hardware_address, 1900, 4);
    ASSERT_TRUE(addressing.has_value());
    const HardwareAddress expected {0x01, 0x00, 0x5e, 0x7f, 0xff, 0xfa};
    EXPECT_EQ(addressing->destination_hardware_address, expected);
    EXPECT_EQ(addressing->ttl, 4);
}

} // namespace
} // namespace ssdp
