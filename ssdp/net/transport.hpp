#pragma once

#include "ssdp/net/datagram.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace ssdp
{

/**
 * @brief Datagram I/O used by the responder.
 *
 * One thread receives while other threads send. Implementations make send() safe to call while
 * receive() is waiting, and serialize concurrent sends.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /// Acquire and configure the socket. Throws boost::system::system_error on failure.
    virtual void open() = 0;

    /// Send one datagram. Failures are logged and reported as false, never thrown.
    virtual bool send(const OutgoingDatagram& datagram) = 0;

    /**
     * @brief Wait at most @p timeout for the next datagram.
     * @return std::nullopt on timeout, on a receive error, or when the data read was not a datagram for us.
     */
    virtual std::optional<ReceivedDatagram> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    /// Human readable summary for log lines, e.g. "multicast 239.255.255.250:1900".
    virtual std::string description() const = 0;
};

} // namespace ssdp
