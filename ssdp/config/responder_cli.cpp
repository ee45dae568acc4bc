#include "ssdp/config/responder_cli.hpp"

#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/protocol/ssdp_constants.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace ssdp
{

namespace
{

std::chrono::milliseconds to_milliseconds(double seconds)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(seconds));
}

} // namespace

CommandLineOptions parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    const NetworkConfig defaults;

    po::options_description desc("SSDP Responder Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Configuration file with the options below")
        ("services,s", po::value<std::string>()->required(), "Service definitions JSON file (required)")
        ("address", po::value<std::string>()->default_value(defaults.multicast_address), "Multicast group address")
        ("port", po::value<unsigned short>()->default_value(defaults.port), "SSDP port")
        ("transport", po::value<std::string>()->default_value("auto"), "Transport: auto, multicast or spoofing")
        ("interface,i", po::value<std::string>()->default_value(defaults.interface_name), "Interface for raw injection")
        ("interface-address", po::value<std::string>()->default_value(defaults.interface_address), "Interface address for the group join")
        ("buffer-size", po::value<std::size_t>()->default_value(defaults.buffer_size), "Receive buffer size in bytes")
        ("multicast-ttl", po::value<int>()->default_value(defaults.multicast_ttl), "TTL of multicast packets")
        ("spoofed-ttl", po::value<int>()->default_value(defaults.spoofed_ttl), "TTL of raw injected packets")
        ("user", po::value<std::string>()->default_value(defaults.user), "User to switch to after opening the raw socket")
        ("group", po::value<std::string>()->default_value(defaults.group), "Group to switch to after opening the raw socket")
        ("announce-period", po::value<double>()->default_value(300.0), "Seconds between ssdp:alive announcements")
        ("settle-delay", po::value<double>()->default_value(2.0), "Seconds before the first ssdp:alive announcement")
        ("withdrawal-nts", po::value<std::string>()->default_value(protocol::nts_goodbye), "NTS announced on shutdown: ssdp:goodbye or ssdp:byebye");
    // clang-format on

    std::vector<std::string> arguments;
    arguments.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        arguments.emplace_back(argv[i]);
    }

    int verbosity = 0;
    for (size_t i = 1; i < arguments.size(); ++i)
    {
        const std::string& argument = arguments[i];
        if (argument.size() >= 2 && argument[0] == '-' && argument[1] == 'v')
        {
            size_t v_count = 0;
            for (size_t j = 1; j < argument.size() && argument[j] == 'v'; ++j)
            {
                ++v_count;
            }

            if (v_count == argument.size() - 1)
            {
                verbosity = static_cast<int>(v_count);
                break;
            }
        }
    }

    po::variables_map variables;

    CommandLineOptions options;

    try
    {
        // argv[0] is the program name, the parser skips it
        auto parser = po::command_line_parser(std::vector<std::string>(arguments.begin() + (arguments.empty() ? 0 : 1), arguments.end()))
                          .options(desc)
                          .allow_unregistered();

        po::store(parser.run(), variables);

        if (variables.count("help") != 0U)
        {
            std::cout << desc << '\n';
            std::cout << "\nVerbosity levels:\n"
                      << "  (none)  : Info level  - shows ERROR, WARNING and INFO messages\n"
                      << "  -v      : Debug level - adds DEBUG messages\n"
                      << "  -vv     : Trace level - shows all messages, including every datagram\n";
            std::exit(0);
        }

        if (variables.count("config") != 0U)
        {
            const std::string config_path = variables["config"].as<std::string>();
            po::store(po::parse_config_file<char>(config_path.c_str(), desc), variables);
        }

        po::notify(variables);

        NetworkConfig& network = options.responder.network;

        network.multicast_address = variables["address"].as<std::string>();
        network.port              = variables["port"].as<unsigned short>();
        network.interface_name    = variables["interface"].as<std::string>();
        network.interface_address = variables["interface-address"].as<std::string>();
        network.buffer_size       = variables["buffer-size"].as<std::size_t>();
        network.multicast_ttl     = variables["multicast-ttl"].as<int>();
        network.spoofed_ttl       = variables["spoofed-ttl"].as<int>();
        network.user              = variables["user"].as<std::string>();
        network.group             = variables["group"].as<std::string>();

        const std::string transport = variables["transport"].as<std::string>();
        auto mode                   = transport_mode_from_string(transport);
        if (!mode)
        {
            throw po::error("Invalid --transport '" + transport + "', expected auto, multicast or spoofing.");
        }
        network.transport_mode = *mode;

        if (network.buffer_size == 0)
        {
            throw po::error("--buffer-size must be positive.");
        }
        if (network.spoofed_ttl < 1 || network.spoofed_ttl > 255 || network.multicast_ttl < 0 || network.multicast_ttl > 255)
        {
            throw po::error("TTL values must be within 0..255 (1..255 for --spoofed-ttl).");
        }

        const double announce_period = variables["announce-period"].as<double>();
        const double settle_delay    = variables["settle-delay"].as<double>();
        if (announce_period <= 0.0 || settle_delay < 0.0)
        {
            throw po::error("--announce-period must be positive and --settle-delay not negative.");
        }
        options.responder.announce_period = to_milliseconds(announce_period);
        options.responder.settle_delay    = to_milliseconds(settle_delay);

        const std::string withdrawal_nts = variables["withdrawal-nts"].as<std::string>();
        if (withdrawal_nts != protocol::nts_goodbye && withdrawal_nts != protocol::nts_byebye)
        {
            throw po::error("Invalid --withdrawal-nts '" + withdrawal_nts + "', expected ssdp:goodbye or ssdp:byebye.");
        }
        options.responder.withdrawal_nts = withdrawal_nts;

        options.services_path = variables["services"].as<std::string>();

        if (verbosity == 0)
        {
            options.log_level = logging::LogLevel::Info;
        }
        else if (verbosity == 1)
        {
            options.log_level = logging::LogLevel::Debug;
        }
        else
        {
            options.log_level = logging::LogLevel::Trace;
        }

        SSDP_LOG_DEBUG("Verbosity level: " << verbosity);
        SSDP_LOG_DEBUG("Transport mode: " << to_string(network.transport_mode));
        SSDP_LOG_TRACE("Command line arguments parsed successfully");
    }
    catch (const po::error& error)
    {
        SSDP_LOG_ERROR("Error parsing command line: " << error.what());
        std::cerr << "Error: " << error.what() << '\n';
        std::cerr << desc << '\n';
        throw;
    }

    return options;
}

} // namespace ssdp
