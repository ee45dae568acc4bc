#pragma once

#include "ssdp/service/ordered_map.hpp"
#include "ssdp/service/param_value.hpp"

#include <string>
#include <vector>

namespace ssdp
{

/// Resolved placeholder values for one service, in merge order.
using FieldMap = OrderedMap<std::string>;

/// Per-service overrides layered on top of the descriptor params. Must provide "st" unless the params do.
using Service = OrderedMap<std::string>;

/// Name of the resolved field holding a service's search target.
constexpr const char* search_target_field = "st";

/// Name of the resolved field holding the address a spoofed packet claims to come from.
constexpr const char* source_address_field = "ip";

/// Name of the field set to the NTS value when rendering an announcement.
constexpr const char* nts_field = "nts";

struct ServiceTemplates
{
    std::string notify;   ///< Unsolicited alive/goodbye announcement
    std::string response; ///< Unicast reply to a matching M-SEARCH
};

/**
 * @brief A group of advertised services sharing templates and params.
 *
 * Loaded once at startup and never modified afterwards.
 */
class ServiceDescriptor
{
public:
    /**
     * @throws std::invalid_argument if a service has no search target in either its own keys or the params.
     */
    ServiceDescriptor(ServiceTemplates templates, ParamSet params, std::vector<Service> services);

    const ServiceTemplates& templates() const noexcept { return _templates; }
    const ParamSet& params() const noexcept { return _params; }
    const std::vector<Service>& services() const noexcept { return _services; }

private:
    ServiceTemplates _templates;
    ParamSet _params;
    std::vector<Service> _services;
};

} // namespace ssdp
