#include "ssdp/net/transport_selector.hpp"

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/net/multicast_transport.hpp"
#include "ssdp/net/spoofing_transport.hpp"
#include "ssdp/system/privileges.hpp"

#include <boost/system/system_error.hpp>

namespace ssdp
{

TransportSelector::TransportSelector(const NetworkConfig& config) : _config(config)
{
}

std::unique_ptr<Transport> TransportSelector::acquire() const
{
    SSDP_LOG_DEBUG("Transport mode: " << to_string(_config.transport_mode));

    switch (_config.transport_mode)
    {
    case TransportMode::multicast:
        return open_multicast();

    case TransportMode::spoofing:
        return open_spoofing();

    case TransportMode::automatic:
        break;
    }

    try
    {
        return open_multicast();
    }
    catch (const boost::system::system_error& error)
    {
        if (_config.interface_name.empty())
        {
            throw;
        }
        SSDP_LOG_WARNING("Multicast transport unavailable (" << error.what() << "), falling back to raw injection on "
                                                             << _config.interface_name);
    }

    return open_spoofing();
}

std::unique_ptr<Transport> TransportSelector::open_multicast() const
{
    auto transport = std::make_unique<MulticastTransport>(_config);
    transport->open();
    return transport;
}

std::unique_ptr<Transport> TransportSelector::open_spoofing() const
{
    auto transport = std::make_unique<SpoofingTransport>(_config);
    transport->open();

    const PrivilegeDropResult result = drop_privileges(_config.user, _config.group);
    SSDP_LOG_DEBUG("Privilege drop: " << to_string(result));
    return transport;
}

} // namespace ssdp
