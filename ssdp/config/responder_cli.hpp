#pragma once

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/responder/responder_config.hpp"

#include <string>

namespace ssdp
{

struct CommandLineOptions
{
    ResponderConfig responder;
    std::string services_path;
    logging::LogLevel log_level = logging::LogLevel::Info;
};

/**
 * @brief Parse the responder's command line, merged with an optional --config file.
 *
 * Values given on the command line win over the configuration file. Prints usage and exits on --help.
 * @throws boost::program_options::error on invalid or missing options.
 */
CommandLineOptions parse_command_line(int argc, char* argv[]);

} // namespace ssdp
