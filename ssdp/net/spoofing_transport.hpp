#pragma once

#include "ssdp/net/datagram.hpp"
#include "ssdp/net/network_config.hpp"
#include "ssdp/net/packet/udp_frame.hpp"
#include "ssdp/net/transport.hpp"

#include <boost/asio/generic/raw_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace ssdp
{

/**
 * @brief Address the frame that carries @p datagram, sent from @p source_port with IP TTL @p ttl.
 *
 * Multicast destinations get the group's mapped hardware address, unicast destinations the one carried
 * on the datagram.
 * @return std::nullopt (reason logged) without a spoofed source, for a non-IPv4 destination, or for a
 *         unicast destination whose hardware address is unknown.
 */
std::optional<UdpFrameAddressing> make_frame_addressing(const OutgoingDatagram& datagram, const HardwareAddress& source_hardware_address,
                                                        unsigned short source_port, int ttl);

/**
 * @brief Link-layer transport for advertising services whose address this host does not own.
 *
 * Opens an AF_PACKET socket on one interface (needs root or CAP_NET_RAW). Received frames are
 * filtered down to UDP datagrams for the SSDP port; sent datagrams are wrapped into complete
 * Ethernet/IPv4/UDP frames whose source address is the advertised service's address.
 */
class SpoofingTransport : public Transport
{
public:
    explicit SpoofingTransport(const NetworkConfig& config);
    ~SpoofingTransport() override;

    SpoofingTransport(const SpoofingTransport&)            = delete;
    SpoofingTransport& operator=(const SpoofingTransport&) = delete;
    SpoofingTransport(SpoofingTransport&&)                 = delete;
    SpoofingTransport& operator=(SpoofingTransport&&)      = delete;

    void open() override;

    /**
     * Requires @c datagram.spoofed_source. Multicast destinations use the group's mapped hardware
     * address; unicast destinations need @c datagram.destination_hardware_address.
     */
    bool send(const OutgoingDatagram& datagram) override;

    std::optional<ReceivedDatagram> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    std::string description() const override;

private:
    using raw_protocol = boost::asio::generic::raw_protocol;

    raw_protocol::endpoint link_endpoint(const HardwareAddress& destination) const;
    void read_hardware_address();
    void add_multicast_membership(const HardwareAddress& group_address);

    NetworkConfig _config;
    boost::asio::io_context _io_context;
    raw_protocol::socket _socket;
    raw_protocol::endpoint _sender_endpoint;
    std::vector<std::uint8_t> _recv_buffer;

    unsigned int _interface_index = 0;
    HardwareAddress _hardware_address {};

    /// Guards every call on _socket and _next_identification.
    std::mutex _socket_mutex;
    std::uint16_t _next_identification = 0;
};

} // namespace ssdp
