#include "ssdp/responder/responder.hpp"

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/net/transport_selector.hpp"
#include "ssdp/protocol/ssdp_constants.hpp"
#include "ssdp/responder/search_matcher.hpp"
#include "ssdp/service/template_renderer.hpp"

#include <boost/system/error_code.hpp>

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ssdp
{

namespace
{

std::string join_targets(const std::vector<std::string>& targets)
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t index = 0; index < targets.size(); ++index)
    {
        oss << (index == 0 ? "" : ", ") << targets[index];
    }
    oss << "]";
    return oss.str();
}

} // namespace

Responder::Responder(const ResponderConfig& config, std::vector<ServiceDescriptor> descriptors)
    : Responder(config, std::move(descriptors), [network = config.network]() { return TransportSelector(network).acquire(); })
{
}

Responder::Responder(const ResponderConfig& config, std::vector<ServiceDescriptor> descriptors, TransportAcquirer acquire_transport)
    : _config(config), _descriptors(std::move(descriptors)), _acquire_transport(std::move(acquire_transport))
{
}

Responder::~Responder()
{
    shutdown();
}

bool Responder::start()
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_state.load() != ResponderState::stopped)
    {
        return false;
    }

    _state = ResponderState::starting;
    try
    {
        _multicast_endpoint = boost::asio::ip::udp::endpoint(boost::asio::ip::make_address_v4(_config.network.multicast_address),
                                                             _config.network.port);
        _transport = _acquire_transport();
        if (!_transport)
        {
            throw std::runtime_error("Transport acquisition returned no transport");
        }
    }
    catch (const std::exception& error)
    {
        SSDP_LOG_ERROR("Failed to start responder: " << error.what());
        _state = ResponderState::stopped;
        throw;
    }

    _run_state.set_running();
    _state     = ResponderState::running;
    _receiver  = std::thread(&Responder::receive_loop, this);
    _scheduler = std::thread(&Responder::schedule_loop, this);

    std::size_t service_count = 0;
    for (const auto& descriptor : _descriptors)
    {
        service_count += descriptor.services().size();
    }
    SSDP_LOG_INFO("Responder running on " << _transport->description() << " with " << service_count << " service(s)");
    return true;
}

void Responder::run()
{
    while (_run_state.is_running())
    {
        auto request = _requests.pop_for(_config.poll_interval);
        if (request)
        {
            dispatch(*request);
        }
    }
    SSDP_LOG_DEBUG("Dispatcher shutting down...");
}

void Responder::shutdown()
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_state.load() != ResponderState::running)
    {
        return;
    }

    _state = ResponderState::shutting_down;
    _run_state.set_stopped();

    if (_scheduler.joinable())
    {
        _scheduler.join();
    }
    if (_receiver.joinable())
    {
        _receiver.join();
    }

    const std::size_t sent = announce(_config.withdrawal_nts);
    SSDP_LOG_DEBUG("Sent " << sent << " " << _config.withdrawal_nts << " announcement(s)");

    _state = ResponderState::stopped;
    SSDP_LOG_INFO("Shutdown");
    SSDP_LOG_INFO("---------------------------");
}

void Responder::dispatch(const Request& request)
{
    switch (request.method)
    {
    case Method::search:
        respond(request);
        break;

    case Method::notify:
        SSDP_LOG_DEBUG("Ignoring NOTIFY " << request.headers.values("NT").size() << " target(s) from " << request.remote);
        break;
    }
}

std::size_t Responder::respond(const Request& request)
{
    const std::vector<std::string>& targets = request.headers.values(protocol::search_target_header);

    bool found       = false;
    std::size_t sent = 0;
    for (const auto& descriptor : _descriptors)
    {
        for (const auto& service : descriptor.services())
        {
            try
            {
                const FieldMap fields             = resolve(descriptor.params(), service);
                const std::string& service_target = fields.at(search_target_field);

                for (const auto& target : targets)
                {
                    if (!search_target_matches(target, service_target))
                    {
                        continue;
                    }

                    found = true;
                    if (send_rendered(fields, render(descriptor.templates().response, fields), request.remote,
                                      request.remote_hardware_address))
                    {
                        ++sent;
                    }
                }
            }
            catch (const std::exception& error)
            {
                SSDP_LOG_ERROR("Skipping service in M-SEARCH response: " << error.what());
            }
        }
    }

    const std::vector<std::string>& mx = request.headers.values("MX");
    if (!mx.empty())
    {
        SSDP_LOG_DEBUG("MX: " << mx.front());
    }
    SSDP_LOG_INFO("M-SEARCH for " << join_targets(targets) << " from " << request.remote << ", found: " << std::boolalpha << found);
    return sent;
}

std::size_t Responder::announce(const std::string& nts)
{
    std::size_t sent = 0;
    for (const auto& descriptor : _descriptors)
    {
        for (const auto& service : descriptor.services())
        {
            try
            {
                FieldMap fields = resolve(descriptor.params(), service);
                fields.set(nts_field, nts);
                if (send_rendered(fields, render(descriptor.templates().notify, fields), _multicast_endpoint, std::nullopt))
                {
                    ++sent;
                }
            }
            catch (const std::exception& error)
            {
                SSDP_LOG_ERROR("Cannot announce " << nts << " for a service: " << error.what());
            }
        }
    }

    SSDP_LOG_DEBUG("Announced " << nts << " for " << sent << " service(s)");
    return sent;
}

bool Responder::send_rendered(const FieldMap& fields, std::string payload, const boost::asio::ip::udp::endpoint& destination,
                              const std::optional<HardwareAddress>& destination_hardware_address)
{
    OutgoingDatagram datagram {std::move(payload), destination, destination_hardware_address, std::nullopt};

    auto source = fields.find(source_address_field);
    if (source != fields.end())
    {
        boost::system::error_code error_code;
        auto address = boost::asio::ip::make_address_v4(source->second, error_code);
        if (error_code)
        {
            SSDP_LOG_WARNING("Ignoring invalid source address '" << source->second << "': " << error_code.message());
        }
        else
        {
            datagram.spoofed_source = address;
        }
    }

    SSDP_LOG_TRACE("Sending to " << destination << ":\n" << datagram.payload);
    return _transport->send(datagram);
}

void Responder::receive_loop()
{
    while (_run_state.is_running())
    {
        auto datagram = _transport->receive(_config.receive_timeout);
        if (!datagram)
        {
            continue;
        }

        try
        {
            auto request = _parsers.parse(*datagram);
            if (request)
            {
                SSDP_LOG_TRACE("Queued " << to_string(request->method) << " from " << request->remote);
                _requests.push(std::move(*request));
            }
        }
        catch (const MalformedRequestError& error)
        {
            SSDP_LOG_DEBUG("Dropped malformed datagram from " << datagram->sender << ": " << error.what());
        }
    }
    SSDP_LOG_INFO("Socket handler shutting down...");
}

void Responder::schedule_loop()
{
    if (!sleep_while_running(_config.settle_delay))
    {
        SSDP_LOG_INFO("Scheduler shutting down...");
        return;
    }

    announce(protocol::nts_alive);
    auto next_announcement = std::chrono::steady_clock::now() + _config.announce_period;

    while (_run_state.is_running())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= next_announcement)
        {
            announce(protocol::nts_alive);
            next_announcement = std::chrono::steady_clock::now() + _config.announce_period;
            continue;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next_announcement - now);
        std::this_thread::sleep_for(std::min(_config.poll_interval, remaining + std::chrono::milliseconds(1)));
    }
    SSDP_LOG_INFO("Scheduler shutting down...");
}

bool Responder::sleep_while_running(std::chrono::milliseconds duration) const
{
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (_run_state.is_running())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(_config.poll_interval, remaining + std::chrono::milliseconds(1)));
    }
    return false;
}

} // namespace ssdp
