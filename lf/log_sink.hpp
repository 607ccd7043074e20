#ifndef lf_log_sink_hpp
#define lf_log_sink_hpp

#include <lf/log_severity.hpp>

#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace lf {

/**
 * A destination for log messages, installed with lf::log::add_sink().
 *
 * Sinks are called from any thread that logs, including the refresh loop and the ZooKeeper event thread.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  virtual void log(severity sev, std::string&& message) = 0;
};

/// Forward each message to a function.
class function_sink : public log_sink {
public:
  using function_type = std::function<void(severity, std::string&&)>;

  explicit function_sink(function_type f)
      : function_(std::move(f)) {
  }

  void log(severity sev, std::string&& message) override {
    function_(sev, std::move(message));
  }

private:
  function_type function_;
};

/// Create a sink calling @a f for each message.
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  return std::make_shared<function_sink>(function_sink::function_type(std::forward<Functor>(f)));
}

/**
 * Write each message as one line to a std::ostream.
 *
 * Concurrent messages are serialized, so lines do not interleave.  The stream must outlive the sink.
 */
class ostream_sink : public log_sink {
public:
  explicit ostream_sink(std::ostream& os)
      : mu_()
      , os_(os) {
  }

  void log(severity sev, std::string&& message) override;

private:
  std::mutex mu_;
  std::ostream& os_;
};

/// Create a sink writing to @a os, typically std::clog.
inline std::shared_ptr<log_sink> make_ostream_sink(std::ostream& os) {
  return std::make_shared<ostream_sink>(os);
}

} // namespace lf

#endif // lf_log_sink_hpp
