#include "ssdp/service/value_producers.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>

namespace ssdp
{

namespace
{

std::string http_date()
{
    const std::time_t now = std::time(nullptr);
    std::tm utc {};
    gmtime_r(&now, &utc);

    char text[64];
    const std::size_t length = std::strftime(text, sizeof(text), "%a, %d %b %Y %H:%M:%S GMT", &utc);
    return std::string(text, length);
}

std::string unix_time()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace

ValueProducer make_value_producer(const std::string& name)
{
    if (name == "http_date")
    {
        return &http_date;
    }
    if (name == "unix_time")
    {
        return &unix_time;
    }
    if (name == "counter")
    {
        auto next = std::make_shared<std::atomic<std::uint64_t>>(1);
        return [next]() { return std::to_string(next->fetch_add(1)); };
    }
    if (name == "uuid")
    {
        return []()
        {
            boost::uuids::random_generator generator;
            return boost::uuids::to_string(generator());
        };
    }
    if (name == "hostname")
    {
        return []() { return boost::asio::ip::host_name(); };
    }
    return ValueProducer();
}

const std::vector<std::string>& value_producer_names()
{
    static const std::vector<std::string> names {"http_date", "unix_time", "counter", "uuid", "hostname"};
    return names;
}

} // namespace ssdp
