#pragma once

#include <stdexcept>

namespace ssdp
{

/// Invalid command line, configuration file or service definitions.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace ssdp
