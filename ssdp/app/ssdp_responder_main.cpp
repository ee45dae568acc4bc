#include "ssdp/config/responder_cli.hpp"
#include "ssdp/config/services_loader.hpp"
#include "ssdp/logging/ssdp_logging.hpp"
#include "ssdp/responder/responder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <thread>

int main(int argc, char* argv[])
{
    ssdp::CommandLineOptions options;
    try
    {
        options = ssdp::parse_command_line(argc, argv);
    }
    catch (const std::exception&)
    {
        // already reported with usage
        return 1;
    }

    ssdp::logging::current_log_level = options.log_level;

    try
    {
        auto descriptors = ssdp::load_services_file(options.services_path);
        if (descriptors.empty())
        {
            SSDP_LOG_WARNING("No service descriptors loaded, only searches will be logged");
        }

        ssdp::Responder responder(options.responder, std::move(descriptors));

        // Installed before start() so a signal during startup is held until the handler can run
        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait(
            [&responder](const boost::system::error_code& error_code, int signal_number)
            {
                if (!error_code)
                {
                    SSDP_LOG_INFO("Received signal " << signal_number << ", shutting down");
                    responder.shutdown();
                }
            });

        responder.start();
        std::thread signal_thread([&signal_context]() { signal_context.run(); });

        responder.run();
        signal_context.stop();
        signal_thread.join();
    }
    catch (const std::exception& error)
    {
        SSDP_LOG_ERROR("Fatal: " << error.what());
        return 1;
    }

    return 0;
}
