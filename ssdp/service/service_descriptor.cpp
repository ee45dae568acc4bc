#include "ssdp/service/service_descriptor.hpp"

#include <stdexcept>
#include <utility>

namespace ssdp
{

ServiceDescriptor::ServiceDescriptor(ServiceTemplates templates, ParamSet params, std::vector<Service> services)
    : _templates(std::move(templates)), _params(std::move(params)), _services(std::move(services))
{
    for (std::size_t index = 0; index < _services.size(); ++index)
    {
        if (!_services[index].contains(search_target_field) && !_params.contains(search_target_field))
        {
            throw std::invalid_argument("Service #" + std::to_string(index) + " has no '" + search_target_field + "' value");
        }
    }
}

} // namespace ssdp
