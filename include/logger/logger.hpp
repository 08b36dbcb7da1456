#ifndef PMTORRENT_LOGGER_HPP
#define PMTORRENT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace pmtorrent::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, ::pmtorrent::logging::logger_type)

// Initialize logging system. An empty log_file logs to the console.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// Adjust the minimum severity accepted by the core
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& name, severity_level& out);

} // namespace pmtorrent::logging

// Convenience macros for logging
#define PMTORRENT_LOG_TRACE BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::trace)
#define PMTORRENT_LOG_DEBUG BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::debug)
#define PMTORRENT_LOG_INFO BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::info)
#define PMTORRENT_LOG_WARN BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::warning)
#define PMTORRENT_LOG_ERROR BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::error)
#define PMTORRENT_LOG_FATAL BOOST_LOG_SEV(pmtorrent::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // PMTORRENT_LOGGER_HPP
