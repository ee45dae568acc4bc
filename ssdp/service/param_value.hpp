#pragma once

#include "ssdp/service/ordered_map.hpp"

#include <functional>
#include <string>
#include <variant>

namespace ssdp
{

/// Zero-argument producer re-evaluated on every render (boot counters, dates, ids).
using ValueProducer = std::function<std::string()>;

/// A descriptor parameter: a literal, or a producer called each time fields are resolved.
using ParamValue = std::variant<std::string, ValueProducer>;

using ParamSet = OrderedMap<ParamValue>;

inline std::string evaluate(const ParamValue& value)
{
    if (const auto* producer = std::get_if<ValueProducer>(&value))
    {
        return (*producer)();
    }
    return std::get<std::string>(value);
}

} // namespace ssdp
