#include "ssdp/protocol/request.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace ssdp
{

void HeaderMap::append(const std::string& name, const std::string& value)
{
    auto iter = std::find_if(_entries.begin(), _entries.end(),
                             [&name](const Entry& entry) { return boost::algorithm::iequals(entry.first, name); });
    if (iter == _entries.end())
    {
        _entries.emplace_back(name, std::vector<std::string> {value});
    }
    else
    {
        iter->second.push_back(value);
    }
}

const std::vector<std::string>& HeaderMap::values(const std::string& name) const
{
    static const std::vector<std::string> no_values;

    auto iter = std::find_if(_entries.begin(), _entries.end(),
                             [&name](const Entry& entry) { return boost::algorithm::iequals(entry.first, name); });
    return iter == _entries.end() ? no_values : iter->second;
}

bool HeaderMap::contains(const std::string& name) const
{
    return !values(name).empty();
}

} // namespace ssdp
