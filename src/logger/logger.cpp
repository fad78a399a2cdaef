#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>

namespace dsb::logging {

namespace {

namespace expr = boost::log::expressions;

// <timestamp> [<severity>] <message>
auto record_format() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << expr::attr<severity_level>("Severity") << "] "
      << expr::smessage;
}

} // namespace

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, severity_logger_type) {
  severity_logger_type logger;
  logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
  logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
  return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(record_format());

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging to " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  boost::log::core::get()->remove_all_sinks();

  auto sink = boost::log::add_console_log(std::clog, boost::log::keywords::auto_flush = true);
  sink->set_formatter(record_format());

  boost::log::add_common_attributes();
  set_log_level(min_level);
  enable_logging();
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

std::optional<severity_level> parse_severity(const std::string& text) {
  severity_level level;
  if (boost::log::trivial::from_string(text.data(), text.size(), level)) {
    return level;
  }
  return std::nullopt;
}

} // namespace dsb::logging
