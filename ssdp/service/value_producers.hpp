#pragma once

#include "ssdp/service/param_value.hpp"

#include <string>
#include <vector>

namespace ssdp
{

/**
 * @brief Create one of the built-in computed param values by name.
 *
 * - "http_date": current time as an RFC 1123 date ("Mon, 19 Oct 2026 14:42:00 GMT")
 * - "unix_time": seconds since the epoch
 * - "counter":   1, 2, 3, ... one step per evaluation, private to the returned producer
 * - "uuid":      a fresh random UUID
 * - "hostname":  the host name of this machine
 *
 * @return An empty producer if @p name is not a built-in.
 */
ValueProducer make_value_producer(const std::string& name);

/// Names accepted by make_value_producer().
const std::vector<std::string>& value_producer_names();

} // namespace ssdp
