#ifndef DSB_LOGGER_HPP
#define DSB_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>

namespace dsb::logging {

// Shared with BOOST_LOG_TRIVIAL so one filter governs both
using severity_level = boost::log::trivial::severity_level;

using severity_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, severity_logger_type)

// Replaces all sinks with a text file sink, truncating the file
void init_logging(const std::string& log_file = "dsb_node.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Accepts trace, debug, info, warning, error and fatal
std::optional<severity_level> parse_severity(const std::string& text);

} // namespace dsb::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(dsb::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // DSB_LOGGER_HPP
