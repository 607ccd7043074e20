#ifndef lf_log_severity_hpp
#define lf_log_severity_hpp

#include <iosfwd>
#include <string>

/**
 * Log lines below this severity compile to nothing.
 *
 * The refresh loop traces each cycle, define LF_MIN_SEVERITY as trace or debug before including lf/log.hpp to see
 * those lines.
 */
#ifndef LF_MIN_SEVERITY
#define LF_MIN_SEVERITY info
#endif // LF_MIN_SEVERITY

namespace lf {

/// Severity of a log line, in the same order as syslog levels.
enum class severity {
  trace,
  debug,
  /// Normal progress, a new leader or a (re)connected session.
  info,
  notice,
  /// Transient failures that the refresh loop retries.
  warning,
  /// Failures the library cannot recover from by itself.
  error,
  critical,
  alert,
  fatal,
  LOWEST = int(trace),
  HIGHEST = int(fatal),
  LOWEST_ENABLED = int(LF_MIN_SEVERITY),
};

std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Parse the names printed by operator<<, used for --log-level.
 *
 * @throws lf::configuration_error for unknown names.
 */
severity parse_severity(std::string const& name);

} // namespace lf

#endif // lf_log_severity_hpp
