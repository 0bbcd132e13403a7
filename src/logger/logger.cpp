#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace diskprobe::logging {

namespace {

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

// Kept so set_log_level can re-filter the console without touching the file sink
boost::shared_ptr<console_sink> g_stdout_sink;
boost::shared_ptr<console_sink> g_stderr_sink;

boost::shared_ptr<console_sink> make_console_sink(std::ostream& stream) {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&stream, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<console_sink>(backend);
    sink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
    return sink;
}

// Progress lines go to stdout, errors to stderr
void apply_console_filters(severity_level min_level) {
    const severity_level err_level = std::max(min_level, severity_level::error);
    if (g_stdout_sink) {
        g_stdout_sink->set_filter(severity >= min_level && severity < severity_level::error);
    }
    if (g_stderr_sink) {
        g_stderr_sink->set_filter(severity >= err_level);
    }
}

} // namespace

//==============================================
// SEVERITY FORMATTING
//==============================================

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

severity_level console_threshold(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::quiet:   return severity_level::error;
        case Verbosity::verbose: return severity_level::debug;
        case Verbosity::normal:
        default:                 return severity_level::info;
    }
}

//==============================================
// GLOBAL LOGGER
//==============================================

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, severity_logger_type) {
    severity_logger_type logger;

    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    logger.add_attribute("Scope", boost::log::attributes::named_scope());

    return logger;
}

//==============================================
// SINK SETUP
//==============================================

void init_logging(const LogConfig& config) {
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Console output carries the message text only
        g_stdout_sink = make_console_sink(std::cout);
        g_stderr_sink = make_console_sink(std::cerr);
        apply_console_filters(console_threshold(config.verbosity));
        boost::log::core::get()->add_sink(g_stdout_sink);
        boost::log::core::get()->add_sink(g_stderr_sink);

        if (!config.log_file.empty()) {
            std::filesystem::path log_path = std::filesystem::absolute(config.log_file);

            auto file_backend = boost::make_shared<boost::log::sinks::text_file_backend>();
            file_backend->set_file_name_pattern(log_path.string());
            file_backend->set_open_mode(std::ios::out | std::ios::app);
            file_backend->auto_flush(true);

            auto sink = boost::make_shared<file_sink>(file_backend);
            sink->set_formatter(
                expr::stream
                    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                    << " [" << severity << "] "
                    << expr::smessage
            );
            sink->set_filter(severity >= severity_level::trace);
            boost::log::core::get()->add_sink(sink);
        }

        boost::log::add_common_attributes();
        boost::log::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level min_level) {
    apply_console_filters(min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace diskprobe::logging
