#ifndef ZGS_LOGGER_HPP
#define ZGS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <ostream>
#include <string>

namespace zgs {
namespace logging {

// Severity levels understood by the logging setup
enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

// Convert severity level to string for formatting
const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);

// Parses "trace", "debug", ... into a level, returns false on unknown names
bool parse_severity(const std::string& name, severity_level& level);

// Initialize logging: a file sink when log_file is set, else the console
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// ---- RUNTIME CONTROL ----
void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

} // namespace logging
} // namespace zgs

#endif // ZGS_LOGGER_HPP
