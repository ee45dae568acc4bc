#include "ssdp/responder/search_matcher.hpp"

#include "ssdp/protocol/ssdp_constants.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace ssdp
{

bool search_target_matches(const std::string& requested_target, const std::string& service_target)
{
    if (boost::algorithm::starts_with(requested_target, protocol::generic_search_prefix))
    {
        return true;
    }
    return requested_target == service_target;
}

} // namespace ssdp
