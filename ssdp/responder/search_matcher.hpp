#pragma once

#include <string>

namespace ssdp
{

/**
 * @brief Whether an M-SEARCH target selects a service.
 *
 * Targets starting with "ssdp:" (ssdp:all, ...) select every service, anything else must be byte-equal
 * to the service's resolved search target.
 */
bool search_target_matches(const std::string& requested_target, const std::string& service_target);

} // namespace ssdp
