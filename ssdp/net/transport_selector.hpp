#pragma once

#include "ssdp/net/network_config.hpp"
#include "ssdp/net/transport.hpp"

#include <memory>

namespace ssdp
{

/**
 * @brief Picks and opens the transport variant for a NetworkConfig.
 *
 * The spoofing variant drops root privileges right after its raw socket is open, nothing runs with the
 * privileged identity after acquire() returns.
 */
class TransportSelector
{
public:
    explicit TransportSelector(const NetworkConfig& config);

    /**
     * @return An open transport.
     * @throws boost::system::system_error if no variant could be opened or privileges could not be dropped.
     */
    std::unique_ptr<Transport> acquire() const;

private:
    std::unique_ptr<Transport> open_multicast() const;
    std::unique_ptr<Transport> open_spoofing() const;

    NetworkConfig _config;
};

} // namespace ssdp
