#pragma once

#include <iostream>
#include <sstream>

namespace ssdp
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Global log level variable
extern LogLevel current_log_level;

// Helper function to check if a log level should be printed
inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

// Helper function to get log level name
inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace ssdp

// One line per call, assembled first so concurrent units do not interleave
#define SSDP_LOG_AT(level, message)                                                                                                  \
    do                                                                                                                               \
    {                                                                                                                                \
        if (ssdp::logging::should_log(ssdp::logging::LogLevel::level))                                                               \
        {                                                                                                                            \
            std::ostringstream oss;                                                                                                  \
            oss << "[" << ssdp::logging::get_log_level_name(ssdp::logging::LogLevel::level) << "] " << __func__ << ": " << message   \
                << "\n";                                                                                                             \
            std::cout << oss.str() << std::flush;                                                                                    \
        }                                                                                                                            \
    } while (0)

#define SSDP_LOG_ERROR(message)   SSDP_LOG_AT(Error, message)
#define SSDP_LOG_WARNING(message) SSDP_LOG_AT(Warning, message)
#define SSDP_LOG_INFO(message)    SSDP_LOG_AT(Info, message)
#define SSDP_LOG_DEBUG(message)   SSDP_LOG_AT(Debug, message)
#define SSDP_LOG_TRACE(message)   SSDP_LOG_AT(Trace, message)
