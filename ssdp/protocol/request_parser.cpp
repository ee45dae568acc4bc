#include "ssdp/protocol/request_parser.hpp"

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/protocol/ssdp_constants.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace ssdp
{

namespace
{

std::optional<Method> method_from_token(const std::string& token)
{
    if (token == protocol::search_method)
    {
        return Method::search;
    }
    if (token == protocol::notify_method)
    {
        return Method::notify;
    }
    return std::nullopt;
}

} // namespace

std::optional<Request> SsdpRequestParser::try_parse(const ReceivedDatagram& datagram) const
{
    const std::string& data = datagram.payload;
    if (!boost::algorithm::starts_with(data, protocol::search_method) && !boost::algorithm::starts_with(data, protocol::notify_method))
    {
        return std::nullopt;
    }

    std::string text = data;
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    const std::size_t line_break   = text.find('\n');
    const std::string request_line = text.substr(0, line_break);
    const std::string header_block = line_break == std::string::npos ? std::string() : text.substr(line_break + 1);

    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, request_line, boost::algorithm::is_any_of(" "));
    if (tokens.size() != 3)
    {
        throw MalformedRequestError("Request line must have 3 tokens, got " + std::to_string(tokens.size()) + ": '" + request_line +
                                    "'");
    }

    // "NOTIFYX * HTTP/1.1" passes the prefix check but is not a known verb
    auto method = method_from_token(tokens[0]);
    if (!method)
    {
        return std::nullopt;
    }

    Request request {*method, tokens[1], tokens[2], HeaderMap {}, datagram.sender, datagram.sender_hardware_address};

    std::vector<std::string> lines;
    boost::algorithm::split(lines, header_block, boost::algorithm::is_any_of("\n"));
    for (const std::string& raw_line : lines)
    {
        const std::string line = boost::algorithm::trim_copy(raw_line);
        if (line.empty())
        {
            continue;
        }

        const std::size_t colon = line.find(':');
        if (colon == std::string::npos)
        {
            throw MalformedRequestError("Header line without ':': '" + line + "'");
        }

        request.headers.append(boost::algorithm::trim_copy(line.substr(0, colon)), boost::algorithm::trim_copy(line.substr(colon + 1)));
    }

    return request;
}

RequestParserChain::RequestParserChain()
{
    _parsers.push_back(std::make_unique<SsdpRequestParser>());
}

RequestParserChain::RequestParserChain(std::vector<std::unique_ptr<RequestParser>> parsers) : _parsers(std::move(parsers))
{
}

void RequestParserChain::add_parser(std::unique_ptr<RequestParser> parser)
{
    _parsers.push_back(std::move(parser));
}

std::optional<Request> RequestParserChain::parse(const ReceivedDatagram& datagram) const
{
    for (const auto& parser : _parsers)
    {
        auto request = parser->try_parse(datagram);
        if (request)
        {
            return request;
        }
    }

    SSDP_LOG_TRACE("No parser recognized " << datagram.payload.size() << " bytes from " << datagram.sender);
    return std::nullopt;
}

} // namespace ssdp
