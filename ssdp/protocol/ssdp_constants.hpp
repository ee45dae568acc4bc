#pragma once

namespace ssdp
{
namespace protocol
{

constexpr const char* multicast_address = "239.255.255.250";
constexpr unsigned short port           = 1900;

constexpr const char* search_method = "M-SEARCH";
constexpr const char* notify_method = "NOTIFY";

constexpr const char* search_target_header = "ST";

/// A search target starting with this prefix (e.g. "ssdp:all") matches every service.
constexpr const char* generic_search_prefix = "ssdp:";

constexpr const char* nts_alive   = "ssdp:alive";
constexpr const char* nts_goodbye = "ssdp:goodbye";
constexpr const char* nts_byebye  = "ssdp:byebye";

} // namespace protocol
} // namespace ssdp
