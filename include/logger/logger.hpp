#ifndef DOCREP_LOGGER_HPP
#define DOCREP_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace docrep::logging {

using severity_level = boost::log::trivial::severity_level;
using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Global logger used by the convenience macros below
BOOST_LOG_GLOBAL_LOGGER(global_logger, ::docrep::logging::logger_type)

// Installs a rotating file sink and, optionally, a console sink.
// Any previously installed sinks are removed.
void init_logging(const std::string& log_file = "docrep.log",
                  severity_level min_level = severity_level::info,
                  bool console = true);

// Changes the minimum severity of the core filter
void set_log_level(severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Unknown names fall back to info.
severity_level parse_severity(const std::string& name);

const char* to_string(severity_level level);

} // namespace docrep::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(docrep::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // DOCREP_LOGGER_HPP
