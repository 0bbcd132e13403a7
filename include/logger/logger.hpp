#ifndef DISKPROBE_LOGGER_HPP
#define DISKPROBE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <ostream>
#include <string>

namespace diskprobe::logging {

// Define severity levels with string conversion
enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

// How much the console sink lets through
enum class Verbosity {
    quiet,    // errors only
    normal,   // progress lines
    verbose   // per-chunk detail
};

struct LogConfig {
    Verbosity verbosity = Verbosity::normal;
    // Empty means no file sink
    std::string log_file;
};

// Convert severity level to string for formatting
const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);

// Lowest severity the console shows for a verbosity
severity_level console_threshold(Verbosity verbosity);

// Declare the logger type
using severity_logger_type = boost::log::sources::severity_logger<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, severity_logger_type)

// Replaces all sinks: a plain console sink filtered by the configured
// verbosity and, when log_file is set, a timestamped file sink at trace.
void init_logging(const LogConfig& config);

// Adjust the console threshold after init_logging
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace diskprobe::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::trace)
#define LOG_DEBUG BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::debug)
#define LOG_INFO BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::info)
#define LOG_WARN BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::warning)
#define LOG_ERROR BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::error)
#define LOG_FATAL BOOST_LOG_SEV(diskprobe::logging::global_logger::get(), diskprobe::logging::severity_level::fatal)

#endif // DISKPROBE_LOGGER_HPP
