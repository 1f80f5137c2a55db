#ifndef SWARM_LOGGER_HPP
#define SWARM_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace swarm::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
// Throws std::invalid_argument for anything else
severity_level parse_severity(const std::string& name);

// Installs a text file sink (and optionally a console sink) for the trivial logger
// Replaces any previously installed sinks
void init_logging(const std::string& log_file = "swarm.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Changes the severity filter without touching the sinks
void set_log_level(severity_level min_level);

// Flushes and removes every sink
void shutdown_logging();

} // namespace swarm::logging

#endif // SWARM_LOGGER_HPP
