#pragma once

#include "ssdp/service/service_descriptor.hpp"

#include <istream>
#include <string>
#include <vector>

namespace ssdp
{

/**
 * @brief Read service descriptors from a JSON document.
 *
 * @code{.json}
 * { "descriptors": [ {
 *     "notify_template":   ["NOTIFY * HTTP/1.1", "NTS: {nts}", ...],
 *     "response_template": "HTTP/1.1 200 OK\n...\n\n",
 *     "params":   { "ip": "192.168.1.20", "boot_id": { "computed": "counter" } },
 *     "services": [ { "st": "upnp:rootdevice", "usn": "uuid:{uuid}::{st}" } ] } ] }
 * @endcode
 *
 * A template given as an array of lines is joined with "\n" and closed with the empty line that ends
 * the header block. Params and service keys keep document order.
 *
 * @throws ConfigError on malformed JSON, unknown producers or a service without a search target.
 */
std::vector<ServiceDescriptor> load_services(std::istream& input);

/// load_services() on the file at @p path.
std::vector<ServiceDescriptor> load_services_file(const std::string& path);

} // namespace ssdp
