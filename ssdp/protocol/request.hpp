#pragma once

#include "ssdp/net/datagram.hpp"

#include <boost/asio/ip/udp.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ssdp
{

enum class Method
{
    search,
    notify
};

inline const char* to_string(Method method) noexcept
{
    switch (method)
    {
    case Method::search:
        return "M-SEARCH";
    case Method::notify:
        return "NOTIFY";
    }
    return "unknown";
}

/**
 * @brief Header block of a request, keeping every value of a repeated header.
 *
 * Names keep the spelling and order in which they were first seen; lookups ignore ASCII case.
 */
class HeaderMap
{
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    void append(const std::string& name, const std::string& value);

    /// All values of @p name in arrival order, or an empty list.
    const std::vector<std::string>& values(const std::string& name) const;

    bool contains(const std::string& name) const;

    const std::vector<Entry>& entries() const noexcept { return _entries; }

    bool empty() const noexcept { return _entries.empty(); }

private:
    std::vector<Entry> _entries;
};

/// A parsed inbound discovery datagram.
struct Request
{
    Method method;
    std::string path;
    std::string version;
    HeaderMap headers;
    boost::asio::ip::udp::endpoint remote;
    std::optional<HardwareAddress> remote_hardware_address;
};

} // namespace ssdp
