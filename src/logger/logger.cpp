#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace docrep::logging {

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, ::docrep::logging::logger_type) {
  return logger_type();
}

namespace {

// Shared record layout for the file and console sinks
boost::log::formatter make_formatter() {
  namespace expr = boost::log::expressions;
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace sinks = boost::log::sinks;
  namespace keywords = boost::log::keywords;

  try {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      auto backend = boost::make_shared<sinks::text_file_backend>(
          keywords::file_name = log_path.string(),
          keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
          keywords::open_mode = std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      auto sink = boost::make_shared<file_sink>(backend);
      sink->set_formatter(make_formatter());
      core->add_sink(sink);
    }

    if (console) {
      auto backend = boost::make_shared<sinks::text_ostream_backend>();
      backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto sink = boost::make_shared<console_sink>(backend);
      sink->set_formatter(make_formatter());
      core->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    core->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized (file: "
                            << (log_file.empty() ? "<none>" : log_file)
                            << ", level: " << logging::to_string(min_level) << ")";
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace") return severity_level::trace;
  if (name == "debug") return severity_level::debug;
  if (name == "info") return severity_level::info;
  if (name == "warning" || name == "warn") return severity_level::warning;
  if (name == "error") return severity_level::error;
  if (name == "fatal") return severity_level::fatal;
  return severity_level::info;
}

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

} // namespace docrep::logging
