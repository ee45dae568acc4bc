#include "ssdp/config/services_loader.hpp"

#include "ssdp/config/config_error.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/service/value_producers.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace ssdp
{

namespace
{

namespace pt = boost::property_tree;

bool is_array(const pt::ptree& node)
{
    if (node.empty())
    {
        return false;
    }
    for (const auto& child : node)
    {
        if (!child.first.empty())
        {
            return false;
        }
    }
    return true;
}

std::string read_template(const pt::ptree& descriptor, const std::string& key, const std::string& where)
{
    auto node = descriptor.get_child_optional(key);
    if (!node)
    {
        throw ConfigError(where + ": missing '" + key + "'");
    }

    if (node->empty())
    {
        return node->data();
    }

    if (!is_array(*node))
    {
        throw ConfigError(where + ": '" + key + "' must be a string or an array of lines");
    }

    std::string text;
    for (const auto& line : *node)
    {
        if (!line.second.empty())
        {
            throw ConfigError(where + ": every line of '" + key + "' must be a string");
        }
        text += line.second.data();
        text += "\n";
    }
    text += "\n";
    return text;
}

ParamSet read_params(const pt::ptree& descriptor, const std::string& where)
{
    ParamSet params;

    auto node = descriptor.get_child_optional("params");
    if (!node)
    {
        return params;
    }

    for (const auto& param : *node)
    {
        if (param.first.empty())
        {
            throw ConfigError(where + ": 'params' must be an object");
        }

        if (param.second.empty())
        {
            params.set(param.first, param.second.data());
            continue;
        }

        auto producer_name = param.second.get_optional<std::string>("computed");
        if (!producer_name || param.second.size() != 1)
        {
            throw ConfigError(where + ": param '" + param.first + "' must be a string or {\"computed\": <name>}");
        }

        ValueProducer producer = make_value_producer(*producer_name);
        if (!producer)
        {
            throw ConfigError(where + ": param '" + param.first + "' uses unknown producer '" + *producer_name + "'");
        }
        params.set(param.first, std::move(producer));
    }

    return params;
}

std::vector<Service> read_services(const pt::ptree& descriptor, const std::string& where)
{
    auto node = descriptor.get_child_optional("services");
    if (!node || !is_array(*node))
    {
        throw ConfigError(where + ": 'services' must be a non-empty array");
    }

    std::vector<Service> services;
    for (const auto& entry : *node)
    {
        if (entry.second.empty())
        {
            throw ConfigError(where + ": every service must be an object");
        }

        Service service;
        for (const auto& field : entry.second)
        {
            if (field.first.empty() || !field.second.empty())
            {
                throw ConfigError(where + ": service values must be strings keyed by name");
            }
            service.set(field.first, field.second.data());
        }
        services.push_back(std::move(service));
    }
    return services;
}

} // namespace

std::vector<ServiceDescriptor> load_services(std::istream& input)
{
    pt::ptree root;
    try
    {
        pt::read_json(input, root);
    }
    catch (const pt::json_parser_error& error)
    {
        throw ConfigError(std::string("Invalid services JSON: ") + error.what());
    }

    auto descriptors_node = root.get_child_optional("descriptors");
    if (!descriptors_node)
    {
        throw ConfigError("Services JSON has no 'descriptors' array");
    }

    std::vector<ServiceDescriptor> descriptors;
    for (const auto& entry : *descriptors_node)
    {
        const std::string where = "descriptor #" + std::to_string(descriptors.size());
        if (!entry.first.empty())
        {
            throw ConfigError("'descriptors' must be an array");
        }

        ServiceTemplates templates {read_template(entry.second, "notify_template", where),
                                    read_template(entry.second, "response_template", where)};
        try
        {
            descriptors.emplace_back(std::move(templates), read_params(entry.second, where), read_services(entry.second, where));
        }
        catch (const std::invalid_argument& error)
        {
            throw ConfigError(where + ": " + error.what());
        }
        SSDP_LOG_DEBUG("Loaded " << where << " with " << descriptors.back().services().size() << " service(s)");
    }

    return descriptors;
}

std::vector<ServiceDescriptor> load_services_file(const std::string& path)
{
    std::ifstream input(path);
    if (!input)
    {
        throw ConfigError("Cannot open services file '" + path + "'");
    }

    SSDP_LOG_INFO("Loading services from " << path);
    return load_services(input);
}

} // namespace ssdp
