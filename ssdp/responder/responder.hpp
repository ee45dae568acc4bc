#pragma once

#include "ssdp/net/transport.hpp"
#include "ssdp/protocol/request.hpp"
#include "ssdp/protocol/request_parser.hpp"
#include "ssdp/responder/responder_config.hpp"
#include "ssdp/responder/responder_states.hpp"
#include "ssdp/service/service_descriptor.hpp"
#include "ssdp/threading/blocking_queue.hpp"
#include "ssdp/threading/run_state.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ssdp
{

/**
 * @brief Answers SSDP searches and announces a fixed set of services.
 *
 * Three units share one RunState and one request queue:
 * - receiver thread: transport receive -> parse -> queue
 * - scheduler thread: "alive" after the settle delay, then once per announce period
 * - dispatcher: run(), on the caller's thread, answers queued M-SEARCH requests one at a time
 *
 * shutdown() clears the run state, joins the receiver and scheduler, then multicasts the withdrawal NTS.
 */
class Responder
{
public:
    /// Returns an open transport or throws.
    using TransportAcquirer = std::function<std::unique_ptr<Transport>()>;

    /// Uses TransportSelector on @c config.network.
    Responder(const ResponderConfig& config, std::vector<ServiceDescriptor> descriptors);
    Responder(const ResponderConfig& config, std::vector<ServiceDescriptor> descriptors, TransportAcquirer acquire_transport);

    ~Responder();

    Responder(const Responder&)            = delete;
    Responder& operator=(const Responder&) = delete;
    Responder(Responder&&)                 = delete;
    Responder& operator=(Responder&&)      = delete;

    /**
     * @brief Acquire the transport and start the receiver and scheduler.
     * @return false if the responder is not stopped.
     * @throws whatever the transport acquisition throws; no unit has been started in that case.
     */
    bool start();

    /// Dispatch queued requests until shutdown() is called.
    void run();

    /// Stop the units and announce the withdrawal. Does nothing unless running; blocks until stopped.
    void shutdown();

    ResponderState state() const noexcept { return _state.load(); }

    /// Parser strategies tried in order by the receiver. Extend before start().
    RequestParserChain& parsers() noexcept { return _parsers; }

    void dispatch(const Request& request);

    /**
     * @brief Answer an M-SEARCH with one unicast response per (service, matching ST value).
     * @return Number of responses sent successfully.
     */
    std::size_t respond(const Request& request);

    /**
     * @brief Multicast one NOTIFY per service with @p nts as the "nts" field.
     * @return Number of announcements sent successfully.
     */
    std::size_t announce(const std::string& nts);

private:
    void receive_loop();
    void schedule_loop();

    /// Sleep in poll-interval steps; returns false as soon as the run state is cleared.
    bool sleep_while_running(std::chrono::milliseconds duration) const;

    bool send_rendered(const FieldMap& fields, std::string payload, const boost::asio::ip::udp::endpoint& destination,
                       const std::optional<HardwareAddress>& destination_hardware_address);

    ResponderConfig _config;
    std::vector<ServiceDescriptor> _descriptors;
    TransportAcquirer _acquire_transport;

    std::unique_ptr<Transport> _transport;
    boost::asio::ip::udp::endpoint _multicast_endpoint;
    RequestParserChain _parsers;
    BlockingQueue<Request> _requests;
    RunState _run_state;

    std::atomic<ResponderState> _state {ResponderState::stopped};
    std::mutex _lifecycle_mutex;
    std::thread _receiver;
    std::thread _scheduler;
};

} // namespace ssdp
