#include "ssdp/responder/responder.hpp"

#include "fake_transport.hpp"
#include "ssdp/service/value_producers.hpp"

#include <gtest/gtest.h>

#include <boost/asio/ip/address_v4.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace ssdp
{
namespace
{

using namespace std::chrono_literals;
using boost::asio::ip::make_address_v4;
using boost::asio::ip::udp;
using SentDatagrams = std::vector<test::FakeTransport::SentDatagram>;

const char* const notify_template   = "NOTIFY * HTTP/1.1\nHOST: 239.255.255.250:1900\nNT: {st}\nNTS: {nts}\nUSN: {usn}\n\n";
const char* const response_template = "HTTP/1.1 200 OK\nST: {st}\nUSN: {usn}\nLOCATION: http://{ip}/desc.xml\n\n";

ServiceDescriptor make_descriptor(const std::vector<std::string>& targets)
{
    std::vector<Service> services;
    for (const auto& target : targets)
    {
        services.push_back(Service {{"st", target}, {"usn", "uuid:0000::{st}"}});
    }
    return ServiceDescriptor(ServiceTemplates {notify_template, response_template}, ParamSet {{"ip", std::string("192.168.1.20")}},
                             std::move(services));
}

std::size_t count_starting_with(const SentDatagrams& sent, const std::string& prefix)
{
    return static_cast<std::size_t>(std::count_if(sent.begin(), sent.end(), [&prefix](const test::FakeTransport::SentDatagram& entry)
                                                  { return entry.datagram.payload.rfind(prefix, 0) == 0; }));
}

std::size_t count_containing(const SentDatagrams& sent, const std::string& text)
{
    return static_cast<std::size_t>(std::count_if(sent.begin(), sent.end(), [&text](const test::FakeTransport::SentDatagram& entry)
                                                  { return entry.datagram.payload.find(text) != std::string::npos; }));
}

const std::string response_prefix = "HTTP/1.1 200 OK";
const std::string alive_marker    = "NTS: ssdp:alive";
const std::string goodbye_marker  = "NTS: ssdp:goodbye";

class ResponderTest : public ::testing::Test
{
protected:
    ResponderTest()
    {
        _config.settle_delay    = 10s;
        _config.announce_period = 10s;
        _config.poll_interval   = 5ms;
        _config.receive_timeout = 5ms;
    }

    ~ResponderTest() override
    {
        if (_responder)
        {
            _responder->shutdown();
        }
        if (_dispatcher.joinable())
        {
            _dispatcher.join();
        }
    }

    void create(std::vector<ServiceDescriptor> descriptors)
    {
        _responder = std::make_unique<Responder>(_config, std::move(descriptors),
                                                 [this]() -> std::unique_ptr<Transport>
                                                 {
                                                     auto transport = std::make_unique<test::FakeTransport>();
                                                     transport->open();
                                                     _transport = transport.get();
                                                     return transport;
                                                 });
    }

    void start_and_run()
    {
        ASSERT_TRUE(_responder->start());
        _dispatcher = std::thread([this]() { _responder->run(); });
    }

    void stop()
    {
        _responder->shutdown();
        if (_dispatcher.joinable())
        {
            _dispatcher.join();
        }
    }

    void inject_search(const std::vector<std::string>& targets)
    {
        std::string payload = "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\nMAN: \"ssdp:discover\"\r\nMX: 1\r\n";
        for (const auto& target : targets)
        {
            payload += "ST: " + target + "\r\n";
        }
        payload += "\r\n";
        _transport->inject(ReceivedDatagram {payload, _requester, std::nullopt});
    }

    bool wait_for_count(const std::string& prefix, std::size_t count, std::chrono::milliseconds timeout = 2s)
    {
        return _transport->wait_for_sent([&](const SentDatagrams& sent) { return count_starting_with(sent, prefix) >= count; }, timeout);
    }

    ResponderConfig _config;
    std::unique_ptr<Responder> _responder;
    test::FakeTransport* _transport = nullptr;
    std::thread _dispatcher;
    udp::endpoint _requester {make_address_v4("192.168.1.50"), 50000};
};

TEST_F(ResponderTest, ExactSearchTargetGetsOneUnicastResponse)
{
    create({make_descriptor({"urn:schemas:service:1", "urn:schemas:service:2"})});
    start_and_run();

    inject_search({"urn:schemas:service:1"});
    ASSERT_TRUE(wait_for_count(response_prefix, 1));
    std::this_thread::sleep_for(50ms);

    const SentDatagrams sent = _transport->sent();
    ASSERT_EQ(count_starting_with(sent, response_prefix), 1u);

    const OutgoingDatagram& response = sent.front().datagram;
    EXPECT_EQ(response.destination, _requester);
    EXPECT_EQ(response.payload,
              "HTTP/1.1 200 OK\r\nST: urn:schemas:service:1\r\nUSN: uuid:0000::urn:schemas:service:1\r\n"
              "LOCATION: http://192.168.1.20/desc.xml\r\n\r\n");
    ASSERT_TRUE(response.spoofed_source.has_value());
    EXPECT_EQ(response.spoofed_source->to_string(), "192.168.1.20");
}

TEST_F(ResponderTest, GenericSearchTargetGetsOneResponsePerService)
{
    create({make_descriptor({"urn:schemas:service:1", "urn:schemas:service:2"}), make_descriptor({"upnp:rootdevice"})});
    start_and_run();

    inject_search({"ssdp:all"});
    ASSERT_TRUE(wait_for_count(response_prefix, 3));
    std::this_thread::sleep_for(50ms);

    const SentDatagrams sent = _transport->sent();
    EXPECT_EQ(count_starting_with(sent, response_prefix), 3u);
    EXPECT_EQ(count_containing(sent, "ST: urn:schemas:service:1\r\n"), 1u);
    EXPECT_EQ(count_containing(sent, "ST: urn:schemas:service:2\r\n"), 1u);
    EXPECT_EQ(count_containing(sent, "ST: upnp:rootdevice\r\n"), 1u);
}

TEST_F(ResponderTest, UnknownSearchTargetGetsNoResponse)
{
    create({make_descriptor({"urn:schemas:service:1"})});
    start_and_run();

    inject_search({"urn:schemas:service:9"});
    inject_search({"urn:schemas:service:1"});
    ASSERT_TRUE(wait_for_count(response_prefix, 1));
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(count_starting_with(_transport->sent(), response_prefix), 1u);
}

TEST_F(ResponderTest, EveryMatchingTargetValueGetsItsOwnResponse)
{
    create({make_descriptor({"urn:schemas:service:1"})});
    ASSERT_TRUE(_responder->start());

    Request request {Method::search, "*", "HTTP/1.1", HeaderMap {}, _requester, std::nullopt};
    request.headers.append("ST", "urn:schemas:service:1");
    request.headers.append("ST", "ssdp:all");
    request.headers.append("ST", "urn:schemas:service:2");

    EXPECT_EQ(_responder->respond(request), 2u);
}

TEST_F(ResponderTest, RepeatedSearchGetsIdenticalResponses)
{
    create({make_descriptor({"urn:schemas:service:1"})});
    start_and_run();

    inject_search({"urn:schemas:service:1"});
    inject_search({"urn:schemas:service:1"});
    ASSERT_TRUE(wait_for_count(response_prefix, 2));

    const SentDatagrams sent = _transport->sent();
    ASSERT_EQ(count_starting_with(sent, response_prefix), 2u);
    EXPECT_EQ(sent[0].datagram.payload, sent[1].datagram.payload);
    EXPECT_EQ(sent[0].datagram.destination, sent[1].datagram.destination);
}

TEST_F(ResponderTest, RequesterHardwareAddressIsCarriedToResponse)
{
    create({make_descriptor({"upnp:rootdevice"})});
    ASSERT_TRUE(_responder->start());

    const HardwareAddress requester_mac {0x02, 0x11, 0x22, 0x33, 0x44, 0x55};
    Request request {Method::search, "*", "HTTP/1.1", HeaderMap {}, _requester, requester_mac};
    request.headers.append("ST", "upnp:rootdevice");

    ASSERT_EQ(_responder->respond(request), 1u);
    const SentDatagrams sent = _transport->sent();
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_TRUE(sent.front().datagram.destination_hardware_address.has_value());
    EXPECT_EQ(*sent.front().datagram.destination_hardware_address, requester_mac);
}

TEST_F(ResponderTest, FailedSendsAreNotCounted)
{
    create({make_descriptor({"upnp:rootdevice"})});
    ASSERT_TRUE(_responder->start());
    _transport->fail_sends(true);

    Request request {Method::search, "*", "HTTP/1.1", HeaderMap {}, _requester, std::nullopt};
    request.headers.append("ST", "ssdp:all");

    EXPECT_EQ(_responder->respond(request), 0u);
    EXPECT_EQ(_transport->sent().size(), 1u);
}

TEST_F(ResponderTest, BrokenServiceDoesNotStopOthers)
{
    std::vector<Service> services {Service {{"st", "urn:broken:1"}, {"usn", "{no_such_field}"}},
                                   Service {{"st", "urn:working:1"}, {"usn", "uuid:1"}}};
    create({ServiceDescriptor(ServiceTemplates {notify_template, response_template}, ParamSet {{"ip", std::string("10.0.0.1")}},
                              std::move(services))});
    ASSERT_TRUE(_responder->start());

    Request request {Method::search, "*", "HTTP/1.1", HeaderMap {}, _requester, std::nullopt};
    request.headers.append("ST", "ssdp:all");

    EXPECT_EQ(_responder->respond(request), 1u);
    EXPECT_EQ(_responder->announce("ssdp:alive"), 1u);
}

TEST_F(ResponderTest, MalformedAndForeignDatagramsAreDropped)
{
    create({make_descriptor({"upnp:rootdevice"})});
    start_and_run();

    _transport->inject(ReceivedDatagram {"M-SEARCH *\r\nST: ssdp:all\r\n\r\n", _requester, std::nullopt});
    _transport->inject(ReceivedDatagram {"HTTP/1.1 200 OK\r\nST: ssdp:all\r\n\r\n", _requester, std::nullopt});
    _transport->inject(ReceivedDatagram {"NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:alive\r\n\r\n", _requester, std::nullopt});
    inject_search({"ssdp:all"});

    ASSERT_TRUE(wait_for_count(response_prefix, 1));
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(_transport->sent().size(), 1u);
    EXPECT_EQ(_responder->state(), ResponderState::running);
}

TEST_F(ResponderTest, AnnouncesAliveAfterSettleDelayThenPeriodically)
{
    _config.settle_delay    = 50ms;
    _config.announce_period = 200ms;
    create({make_descriptor({"upnp:rootdevice"})});

    const auto started = std::chrono::steady_clock::now();
    start_and_run();

    ASSERT_TRUE(_transport->wait_for_sent([](const SentDatagrams& sent) { return count_containing(sent, alive_marker) >= 3; }, 3s));
    const auto shutdown_requested = std::chrono::steady_clock::now();
    stop();

    const SentDatagrams sent = _transport->sent();
    std::vector<std::chrono::steady_clock::time_point> alive_times;
    for (const auto& entry : sent)
    {
        if (entry.datagram.payload.find(alive_marker) != std::string::npos)
        {
            alive_times.push_back(entry.sent_at);
            EXPECT_EQ(entry.datagram.destination, udp::endpoint(make_address_v4("239.255.255.250"), 1900));
            EXPECT_EQ(entry.datagram.payload.rfind("NOTIFY * HTTP/1.1\r\n", 0), 0u);
        }
    }

    ASSERT_GE(alive_times.size(), 3u);
    EXPECT_GE(alive_times[0] - started, 45ms);
    for (std::size_t index = 1; index < alive_times.size(); ++index)
    {
        EXPECT_GE(alive_times[index] - alive_times[index - 1], 190ms);
    }

    ASSERT_EQ(count_containing(sent, goodbye_marker), 1u);
    const auto& last = sent.back();
    EXPECT_NE(last.datagram.payload.find(goodbye_marker), std::string::npos);
    EXPECT_GE(last.sent_at, shutdown_requested);
    EXPECT_EQ(last.datagram.destination, udp::endpoint(make_address_v4("239.255.255.250"), 1900));
}

TEST_F(ResponderTest, GoodbyeIsSentOncePerServiceOnlyOnShutdown)
{
    create({make_descriptor({"urn:schemas:service:1", "urn:schemas:service:2"})});
    start_and_run();
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(count_containing(_transport->sent(), goodbye_marker), 0u);

    stop();
    EXPECT_EQ(_responder->state(), ResponderState::stopped);
    EXPECT_EQ(count_containing(_transport->sent(), goodbye_marker), 2u);
    EXPECT_EQ(count_containing(_transport->sent(), alive_marker), 0u);

    stop();
    EXPECT_EQ(count_containing(_transport->sent(), goodbye_marker), 2u);
}

TEST_F(ResponderTest, ConfiguredWithdrawalNtsIsAnnounced)
{
    _config.withdrawal_nts = "ssdp:byebye";
    create({make_descriptor({"upnp:rootdevice"})});
    start_and_run();
    stop();

    const SentDatagrams sent = _transport->sent();
    EXPECT_EQ(count_containing(sent, "NTS: ssdp:byebye\r\n"), 1u);
    EXPECT_EQ(count_containing(sent, goodbye_marker), 0u);
}

class PingParser : public RequestParser
{
public:
    std::optional<Request> try_parse(const ReceivedDatagram& datagram) const override
    {
        if (datagram.payload != "PING")
        {
            return std::nullopt;
        }

        Request request {Method::search, "*", "HTTP/1.1", HeaderMap {}, datagram.sender, std::nullopt};
        request.headers.append("ST", "ssdp:all");
        return request;
    }
};

TEST_F(ResponderTest, AddedParserFeedsDispatcher)
{
    create({make_descriptor({"upnp:rootdevice"})});
    _responder->parsers().add_parser(std::make_unique<PingParser>());
    EXPECT_EQ(_responder->parsers().size(), 2u);
    start_and_run();

    _transport->inject(ReceivedDatagram {"PING", _requester, std::nullopt});
    ASSERT_TRUE(wait_for_count(response_prefix, 1));
    EXPECT_EQ(_transport->sent().front().datagram.destination, _requester);
}

TEST_F(ResponderTest, ShutdownDuringSettleDelayIsPrompt)
{
    _config.settle_delay = 30s;
    create({make_descriptor({"upnp:rootdevice"})});
    start_and_run();

    const auto before = std::chrono::steady_clock::now();
    stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
}

TEST_F(ResponderTest, StartTwiceIsRejected)
{
    create({make_descriptor({"upnp:rootdevice"})});
    EXPECT_EQ(_responder->state(), ResponderState::stopped);

    ASSERT_TRUE(_responder->start());
    EXPECT_EQ(_responder->state(), ResponderState::running);
    EXPECT_FALSE(_responder->start());

    _responder->shutdown();
    EXPECT_EQ(_responder->state(), ResponderState::stopped);
}

TEST_F(ResponderTest, ShutdownBeforeStartDoesNothing)
{
    create({make_descriptor({"upnp:rootdevice"})});
    _responder->shutdown();
    EXPECT_EQ(_responder->state(), ResponderState::stopped);
    EXPECT_EQ(_transport, nullptr);
}

TEST_F(ResponderTest, FailedTransportAcquisitionLeavesResponderStopped)
{
    int attempts = 0;
    Responder responder(_config, {make_descriptor({"upnp:rootdevice"})},
                        [&attempts]() -> std::unique_ptr<Transport>
                        {
                            ++attempts;
                            throw std::runtime_error("no network");
                        });

    EXPECT_THROW(responder.start(), std::runtime_error);
    EXPECT_EQ(responder.state(), ResponderState::stopped);
    EXPECT_THROW(responder.start(), std::runtime_error);
    EXPECT_EQ(attempts, 2);
}

TEST_F(ResponderTest, InvalidSourceAddressIsNotSpoofed)
{
    std::vector<Service> services {Service {{"st", "upnp:rootdevice"}, {"usn", "uuid:1"}}};
    create({ServiceDescriptor(ServiceTemplates {notify_template, response_template},
                              ParamSet {{"ip", std::string("not-an-address")}}, std::move(services))});
    ASSERT_TRUE(_responder->start());

    EXPECT_EQ(_responder->announce("ssdp:alive"), 1u);
    const SentDatagrams sent = _transport->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_FALSE(sent.front().datagram.spoofed_source.has_value());
}

TEST_F(ResponderTest, ComputedParamsChangeBetweenAnnouncements)
{
    std::vector<Service> services {Service {{"st", "upnp:rootdevice"}, {"usn", "uuid:1"}}};
    ServiceTemplates templates {"NOTIFY * HTTP/1.1\nNTS: {nts}\nBOOTID.UPNP.ORG: {boot_id}\n\n", response_template};
    create({ServiceDescriptor(templates, ParamSet {{"ip", std::string("10.0.0.1")}, {"boot_id", make_value_producer("counter")}},
                              std::move(services))});
    ASSERT_TRUE(_responder->start());

    _responder->announce("ssdp:alive");
    _responder->announce("ssdp:alive");

    const SentDatagrams sent = _transport->sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_NE(sent[0].datagram.payload.find("BOOTID.UPNP.ORG: 1\r\n"), std::string::npos);
    EXPECT_NE(sent[1].datagram.payload.find("BOOTID.UPNP.ORG: 2\r\n"), std::string::npos);
}

} // namespace
} // namespace ssdp
