#pragma once

#include "ssdp/net/network_config.hpp"
#include "ssdp/protocol/ssdp_constants.hpp"

#include <chrono>
#include <string>

namespace ssdp
{

struct ResponderConfig
{
    NetworkConfig network;

    /// Interval between repeated "alive" announcements.
    std::chrono::milliseconds announce_period = std::chrono::seconds(300);
    /// Wait before the first "alive" announcement.
    std::chrono::milliseconds settle_delay = std::chrono::seconds(2);
    /// Longest cooperative sleep of the scheduler and dispatcher between run state checks.
    std::chrono::milliseconds poll_interval {100};
    /// Longest time the receiver blocks in one receive call.
    std::chrono::milliseconds receive_timeout {100};

    /// NTS of the announcement sent on shutdown. UPnP devices expect "ssdp:byebye".
    std::string withdrawal_nts = protocol::nts_goodbye;
};

} // namespace ssdp
