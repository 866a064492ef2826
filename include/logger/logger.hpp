#ifndef K7_LOGGER_HPP
#define K7_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace k7 {
namespace logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous file sink receiving every BOOST_LOG_TRIVIAL record
// at or above min_level, replacing any previous sink. Lines are formatted
// "YYYY-MM-DD HH:MM:SS.ffffff [severity] message".
void init_logging(const std::string& log_file = "k7port.log",
                  severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// "trace", "debug", "info", "warning", "error" or "fatal"
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace logger
} // namespace k7

// Convenience macros for logging
#define K7_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define K7_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define K7_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define K7_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define K7_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define K7_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)

#endif // K7_LOGGER_HPP
