#ifndef lf_log_hpp
#define lf_log_hpp
/**
 * @file
 *
 * Logging for the leader finder library.
 *
 * Messages are formatted only if their severity is enabled, both at compile-time (LF_MIN_SEVERITY) and at run-time
 * (lf::log::min_severity()).  By default no sinks are installed and nothing is written.
 */
#include <lf/log_severity.hpp>
#include <lf/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

#define LF_LOG_CAT_I(a, b) a##b
#define LF_LOG_CAT(a, b) LF_LOG_CAT_I(a, b)

/**
 * Stream a message into the @a core at the given severity.
 *
 * The for() scope runs at most once, the message is written when the loop increments.
 */
#define LF_LOG_I(level, core)                                                                                          \
  for (lf::log_line<lf::severity::level> LF_LOG_CAT(lf_log_line_, __LINE__)(__FILE__, __LINE__, core);                 \
       LF_LOG_CAT(lf_log_line_, __LINE__).active(); LF_LOG_CAT(lf_log_line_, __LINE__).flush())                      \
  LF_LOG_CAT(lf_log_line_, __LINE__).stream()

#ifndef LF_LOG
#define LF_LOG(level) LF_LOG_I(level, lf::log::instance())
#endif // LF_LOG

namespace lf {

/**
 * Collect log messages and forward them to the installed sinks.
 *
 * The finders log from the refresh loop and the ZooKeeper event thread as well as from the application threads, all
 * the member functions are thread-safe.
 */
class log {
public:
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// The process-wide instance used by LF_LOG().
  static log& instance();

  void add_sink(std::shared_ptr<log_sink> sink);
  void clear_sinks();

  /// Return true if a message at @a sev would reach at least one sink.
  bool enabled(severity sev) const;

  void write(severity sev, std::string const& msg);

  void min_severity(severity sev) {
    std::lock_guard<std::mutex> lock(mu_);
    min_severity_ = sev;
  }
  severity min_severity() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;
};

namespace detail {
/// Swallow a streaming expression for the log lines disabled at compile-time.
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }
  null_stream& operator<<(std::ostream& (*)(std::ostream&)) {
    return *this;
  }
};

/// Format "<message> (<file basename>:<line>)" with the severity prefix.
std::string format_log_line(severity sev, std::string const& message, char const* file, int line);
} // namespace detail

/**
 * A single log line.
 *
 * The primary template handles the severities enabled at compile-time, see the specialization below for the others.
 */
template <severity level, bool compiled_out = (level < severity::LOWEST_ENABLED)>
class log_line {
public:
  log_line(char const* file, int line, log& core)
      : core_(core)
      , file_(file)
      , line_(line)
      , active_(core.enabled(level))
      , os_() {
  }

  bool active() const {
    return active_;
  }

  std::ostream& stream() {
    return os_;
  }

  void flush() {
    active_ = false;
    core_.write(level, detail::format_log_line(level, os_.str(), file_, line_));
  }

private:
  log& core_;
  char const* file_;
  int line_;
  bool active_;
  std::ostringstream os_;
};

template <severity level>
class log_line<level, true> {
public:
  log_line(char const*, int, log&) {
  }

  bool active() const {
    return false;
  }

  detail::null_stream& stream() {
    return os_;
  }

  void flush() {
  }

private:
  detail::null_stream os_;
};

} // namespace lf

#endif // lf_log_hpp
