#include "ssdp/net/spoofing_transport.hpp"

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/net/packet/udp_frame.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <arpa/inet.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace ssdp
{

namespace
{

[[noreturn]] void throw_system_error(int error_number, const std::string& what)
{
    throw boost::system::system_error(boost::system::error_code(error_number, boost::system::system_category()), what);
}

} // namespace

SpoofingTransport::SpoofingTransport(const NetworkConfig& config)
    : _config(config)
    , _io_context()
    , _socket(_io_context)
    , _recv_buffer(config.buffer_size + ethernet_header_size + 60 + udp_header_size)
{
}

SpoofingTransport::~SpoofingTransport()
{
    close();
}

void SpoofingTransport::open()
{
    _interface_index = ::if_nametoindex(_config.interface_name.c_str());
    if (_interface_index == 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "Unknown interface '" + _config.interface_name + "'");
    }

    const auto group = boost::asio::ip::make_address_v4(_config.multicast_address);

    try
    {
        _socket.open(raw_protocol(AF_PACKET, htons(ETH_P_IP)));

        sockaddr_ll address {};
        address.sll_family   = AF_PACKET;
        address.sll_protocol = htons(ETH_P_IP);
        address.sll_ifindex  = static_cast<int>(_interface_index);
        _socket.bind(raw_protocol::endpoint(&address, sizeof(address)));

        read_hardware_address();
        add_multicast_membership(multicast_hardware_address(group));
    }
    catch (const boost::system::system_error& error)
    {
        SSDP_LOG_ERROR("Failed to open raw socket on " << _config.interface_name << ": " << error.what());
        close();
        throw;
    }

    SSDP_LOG_INFO("Listening on " << description() << " (hardware address " << to_string(_hardware_address) << ")");
}

void SpoofingTransport::read_hardware_address()
{
    ifreq request {};
    std::strncpy(request.ifr_name, _config.interface_name.c_str(), IFNAMSIZ - 1);
    if (::ioctl(_socket.native_handle(), SIOCGIFHWADDR, &request) != 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "SIOCGIFHWADDR " + _config.interface_name);
    }

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(request.ifr_hwaddr.sa_data);
    std::copy(bytes, bytes + _hardware_address.size(), _hardware_address.begin());
}

void SpoofingTransport::add_multicast_membership(const HardwareAddress& group_address)
{
    // Without a link-layer membership the NIC may filter the group's frames out
    packet_mreq membership {};
    membership.mr_ifindex = static_cast<int>(_interface_index);
    membership.mr_type    = PACKET_MR_MULTICAST;
    membership.mr_alen    = static_cast<unsigned short>(group_address.size());
    std::copy(group_address.begin(), group_address.end(), membership.mr_address);

    if (::setsockopt(_socket.native_handle(), SOL_PACKET, PACKET_ADD_MEMBERSHIP, &membership, sizeof(membership)) != 0)
    {
        const int error_number = errno;
        throw_system_error(error_number, "PACKET_ADD_MEMBERSHIP " + to_string(group_address));
    }
}

SpoofingTransport::raw_protocol::endpoint SpoofingTransport::link_endpoint(const HardwareAddress& destination) const
{
    sockaddr_ll address {};
    address.sll_family   = AF_PACKET;
    address.sll_protocol = htons(ETH_P_IP);
    address.sll_ifindex  = static_cast<int>(_interface_index);
    address.sll_halen    = static_cast<unsigned char>(destination.size());
    std::copy(destination.begin(), destination.end(), address.sll_addr);
    return raw_protocol::endpoint(&address, sizeof(address));
}

std::optional<UdpFrameAddressing> make_frame_addressing(const OutgoingDatagram& datagram, const HardwareAddress& source_hardware_address,
                                                        unsigned short source_port, int ttl)
{
    if (!datagram.spoofed_source)
    {
        SSDP_LOG_ERROR("No source address for datagram to " << datagram.destination << ", not sent");
        return std::nullopt;
    }

    const auto destination_address = datagram.destination.address();
    if (!destination_address.is_v4())
    {
        SSDP_LOG_ERROR("Only IPv4 destinations can be spoofed, not " << destination_address);
        return std::nullopt;
    }

    UdpFrameAddressing addressing;
    addressing.source_hardware_address = source_hardware_address;
    if (destination_address.is_multicast())
    {
        addressing.destination_hardware_address = multicast_hardware_address(destination_address.to_v4());
    }
    else if (datagram.destination_hardware_address)
    {
        addressing.destination_hardware_address = *datagram.destination_hardware_address;
    }
    else
    {
        SSDP_LOG_ERROR("Hardware address of " << datagram.destination << " unknown, not sent");
        return std::nullopt;
    }
    addressing.source_address      = *datagram.spoofed_source;
    addressing.destination_address = destination_address.to_v4();
    addressing.source_port         = source_port;
    addressing.destination_port    = datagram.destination.port();
    addressing.ttl                 = static_cast<std::uint8_t>(ttl);
    return addressing;
}

bool SpoofingTransport::send(const OutgoingDatagram& datagram)
{
    auto addressing = make_frame_addressing(datagram, _hardware_address, _config.port, _config.spoofed_ttl);
    if (!addressing)
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(_socket_mutex);
    addressing->identification = _next_identification++;

    std::vector<std::uint8_t> frame;
    try
    {
        frame = assemble_ethernet_frame(*addressing, datagram.payload);
    }
    catch (const std::length_error& error)
    {
        SSDP_LOG_ERROR("Cannot frame datagram to " << datagram.destination << ": " << error.what());
        return false;
    }

    boost::system::error_code error_code;
    _socket.send_to(boost::asio::buffer(frame), link_endpoint(addressing->destination_hardware_address), 0, error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Failed to send frame to " << datagram.destination << ": " << error_code.message());
        return false;
    }

    SSDP_LOG_TRACE("Sent " << frame.size() << " byte frame " << addressing->source_address << " -> " << datagram.destination);
    return true;
}

std::optional<ReceivedDatagram> SpoofingTransport::receive(std::chrono::milliseconds timeout)
{
    bool completed = false;
    boost::system::error_code receive_error;
    std::size_t bytes_transferred = 0;

    _io_context.restart();
    {
        std::lock_guard<std::mutex> lock(_socket_mutex);
        _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _sender_endpoint,
                                   [&completed, &receive_error, &bytes_transferred](const boost::system::error_code& error_code,
                                                                                    std::size_t bytes)
                                   {
                                       completed         = true;
                                       receive_error     = error_code;
                                       bytes_transferred = bytes;
                                   });
    }

    _io_context.run_for(timeout);
    if (!completed)
    {
        {
            std::lock_guard<std::mutex> lock(_socket_mutex);
            _socket.cancel();
        }
        _io_context.run();
    }

    if (receive_error)
    {
        if (receive_error != boost::asio::error::operation_aborted)
        {
            SSDP_LOG_ERROR("Raw receive error: " << receive_error.message());
        }
        return std::nullopt;
    }

    // Packet sockets also see our own outgoing frames
    const auto* link_address = reinterpret_cast<const sockaddr_ll*>(_sender_endpoint.data());
    if (link_address->sll_pkttype == PACKET_OUTGOING)
    {
        return std::nullopt;
    }

    auto frame = parse_ethernet_frame(_recv_buffer.data(), bytes_transferred);
    if (!frame || frame->destination.port() != _config.port)
    {
        return std::nullopt;
    }

    SSDP_LOG_TRACE("Received " << frame->payload.size() << " bytes from " << frame->source << " ("
                               << to_string(frame->source_hardware_address) << ")");
    return ReceivedDatagram {std::move(frame->payload), frame->source, frame->source_hardware_address};
}

void SpoofingTransport::close()
{
    std::lock_guard<std::mutex> lock(_socket_mutex);
    if (_socket.is_open())
    {
        boost::system::error_code error_code;
        _socket.close(error_code);
        if (error_code)
        {
            SSDP_LOG_ERROR("Failed to close raw socket: " << error_code.message());
        }
    }
}

std::string SpoofingTransport::description() const
{
    std::ostringstream oss;
    oss << "raw " << _config.interface_name << " for " << _config.multicast_address << ":" << _config.port;
    return oss.str();
}

} // namespace ssdp
