#ifndef NETBACKUP_LOGGER_HPP
#define NETBACKUP_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <string>

namespace netbackup::logger {

using severity_level = boost::log::trivial::severity_level;

class LoggerError : public std::runtime_error {
public:
    explicit LoggerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Maps trace|debug|info|warning|error|fatal, case insensitive.
// Throws LoggerError on anything else.
severity_level parse_severity(const std::string& name);

// Replaces all sinks with a console sink on stderr and, when log_file is
// not empty, an auto-flushed text file sink appending to log_file
void init_logging(severity_level min_level = boost::log::trivial::info,
                  const std::string& log_file = "");

} // namespace netbackup::logger

#endif // NETBACKUP_LOGGER_HPP
