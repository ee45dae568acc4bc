#include "ssdp/net/multicast_transport.hpp"

#include "ssdp/logging/ssdp_logging.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/system/system_error.hpp>

#include <sstream>

namespace ssdp
{

MulticastTransport::MulticastTransport(const NetworkConfig& config)
    : _config(config), _io_context(), _socket(_io_context), _recv_buffer(config.buffer_size)
{
}

MulticastTransport::~MulticastTransport()
{
    close();
}

void MulticastTransport::open()
{
    namespace ip = boost::asio::ip;

    const ip::address_v4 group             = ip::make_address_v4(_config.multicast_address);
    const ip::address_v4 interface_address = ip::make_address_v4(_config.interface_address);

    try
    {
        _socket.open(ip::udp::v4());
        _socket.set_option(ip::udp::socket::reuse_address(true));
        _socket.set_option(ip::multicast::hops(_config.multicast_ttl));
        _socket.bind(ip::udp::endpoint(ip::address_v4::any(), _config.port));
        _socket.set_option(ip::multicast::join_group(group, interface_address));
    }
    catch (const boost::system::system_error& error)
    {
        SSDP_LOG_ERROR("Failed to set up multicast socket on port " << _config.port << ": " << error.what());
        close();
        throw;
    }

    SSDP_LOG_INFO("Listening on " << description() << " (interface " << interface_address << ")");
}

bool MulticastTransport::send(const OutgoingDatagram& datagram)
{
    std::lock_guard<std::mutex> lock(_socket_mutex);

    boost::system::error_code error_code;
    _socket.send_to(boost::asio::buffer(datagram.payload), datagram.destination, 0, error_code);
    if (error_code)
    {
        SSDP_LOG_ERROR("Failed to send " << datagram.payload.size() << " bytes to " << datagram.destination << ": "
                                         << error_code.message());
        return false;
    }

    SSDP_LOG_TRACE("Sent " << datagram.payload.size() << " bytes to " << datagram.destination);
    return true;
}

std::optional<ReceivedDatagram> MulticastTransport::receive(std::chrono::milliseconds timeout)
{
    bool completed = false;
    boost::system::error_code receive_error;
    std::size_t bytes_transferred = 0;

    _io_context.restart();
    {
        std::lock_guard<std::mutex> lock(_socket_mutex);
        _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                                   [&completed, &receive_error, &bytes_transferred](const boost::system::error_code& error_code,
                                                                                    std::size_t bytes)
                                   {
                                       completed         = true;
                                       receive_error     = error_code;
                                       bytes_transferred = bytes;
                                   });
    }

    // Not locked: the pending operation works on its own copy of the descriptor state
    _io_context.run_for(timeout);
    if (!completed)
    {
        {
            std::lock_guard<std::mutex> lock(_socket_mutex);
            _socket.cancel();
        }
        // Let the handler run with operation_aborted (or with data that raced the timeout)
        _io_context.run();
    }

    if (receive_error)
    {
        if (receive_error != boost::asio::error::operation_aborted)
        {
            SSDP_LOG_ERROR("UDP receive error: " << receive_error.message());
        }
        return std::nullopt;
    }

    SSDP_LOG_TRACE("Received " << bytes_transferred << " bytes from " << _remote_endpoint);
    return ReceivedDatagram {std::string(_recv_buffer.data(), bytes_transferred), _remote_endpoint, std::nullopt};
}

void MulticastTransport::close()
{
    std::lock_guard<std::mutex> lock(_socket_mutex);
    if (_socket.is_open())
    {
        boost::system::error_code error_code;
        _socket.close(error_code);
        if (error_code)
        {
            SSDP_LOG_ERROR("Failed to close multicast socket: " << error_code.message());
        }
    }
}

std::string MulticastTransport::description() const
{
    std::ostringstream oss;
    oss << "multicast " << _config.multicast_address << ":" << local_port();
    return oss.str();
}

unsigned short MulticastTransport::local_port() const
{
    std::lock_guard<std::mutex> lock(_socket_mutex);
    if (!_socket.is_open())
    {
        return _config.port;
    }

    boost::system::error_code error_code;
    const auto endpoint = _socket.local_endpoint(error_code);
    return error_code ? _config.port : endpoint.port();
}

} // namespace ssdp
