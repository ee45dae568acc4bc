#pragma once

#include "ssdp/net/datagram.hpp"
#include "ssdp/protocol/request.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ssdp
{

/// A datagram started with a recognized verb but its request line or a header line is broken.
class MalformedRequestError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Strategy turning a raw datagram into a Request.
 *
 * Returns std::nullopt when the datagram is not something this strategy understands. Throws
 * MalformedRequestError when it claims the datagram but cannot parse it.
 */
class RequestParser
{
public:
    virtual ~RequestParser() = default;

    virtual std::optional<Request> try_parse(const ReceivedDatagram& datagram) const = 0;
};

/// Parses "M-SEARCH" and "NOTIFY" HTTPU requests.
class SsdpRequestParser : public RequestParser
{
public:
    std::optional<Request> try_parse(const ReceivedDatagram& datagram) const override;
};

/**
 * @brief Ordered list of parser strategies; the first one returning a Request wins.
 *
 * Default construction installs the SSDP parser only.
 */
class RequestParserChain
{
public:
    RequestParserChain();
    explicit RequestParserChain(std::vector<std::unique_ptr<RequestParser>> parsers);

    RequestParserChain(const RequestParserChain&)            = delete;
    RequestParserChain& operator=(const RequestParserChain&) = delete;

    void add_parser(std::unique_ptr<RequestParser> parser);

    std::optional<Request> parse(const ReceivedDatagram& datagram) const;

    std::size_t size() const noexcept { return _parsers.size(); }

private:
    std::vector<std::unique_ptr<RequestParser>> _parsers;
};

} // namespace ssdp
