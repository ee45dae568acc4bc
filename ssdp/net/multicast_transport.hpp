#pragma once

#include "ssdp/net/network_config.hpp"
#include "ssdp/net/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <mutex>
#include <vector>

namespace ssdp
{

/**
 * @brief Plain UDP socket bound to the SSDP port and joined to the multicast group.
 *
 * Replies go out from the host's own address.
 */
class MulticastTransport : public Transport
{
public:
    explicit MulticastTransport(const NetworkConfig& config);
    ~MulticastTransport() override;

    MulticastTransport(const MulticastTransport&)            = delete;
    MulticastTransport& operator=(const MulticastTransport&) = delete;
    MulticastTransport(MulticastTransport&&)                 = delete;
    MulticastTransport& operator=(MulticastTransport&&)      = delete;

    void open() override;
    bool send(const OutgoingDatagram& datagram) override;
    std::optional<ReceivedDatagram> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    std::string description() const override;

    /// Port the socket is bound to, which differs from the configured one when that is 0.
    unsigned short local_port() const;

private:
    NetworkConfig _config;
    boost::asio::io_context _io_context;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;
    std::vector<char> _recv_buffer;
    /// Guards every call on _socket. The receiver and the senders run on different threads.
    mutable std::mutex _socket_mutex;
};

} // namespace ssdp
