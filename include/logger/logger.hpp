#ifndef MEMBLOB_LOGGER_HPP
#define MEMBLOB_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <optional>
#include <string>

namespace memblob::logging {

// Engine and shell share boost's trivial severity scale so a single core
// filter applies to both LOG_* and BOOST_LOG_TRIVIAL records
using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using memblob_logger_t = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, memblob_logger_t)

// Initialize logging system with a text file sink
void init_logging(const std::string& log_file = "memblob.log",
                  severity_level min_level = severity_level::info);

// Runtime control of the core filter
void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

// Parses "trace".."fatal", nullopt for anything else
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace memblob::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(memblob::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // MEMBLOB_LOGGER_HPP
