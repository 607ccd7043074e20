#include "lf/log.hpp"

#include <cstring>

namespace lf {

log& log::instance() {
  static log core;
  return core;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> lock(mu_);
  sinks_.push_back(std::move(sink));
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> lock(mu_);
  sinks_.clear();
}

bool log::enabled(severity sev) const {
  std::lock_guard<std::mutex> lock(mu_);
  return not sinks_.empty() and sev >= min_severity_;
}

void log::write(severity sev, std::string const& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // The sinks run without the lock, they may log themselves.
  for (auto const& s : sinks) {
    s->log(sev, std::string(msg));
  }
}

namespace detail {
std::string format_log_line(severity sev, std::string const& message, char const* file, int line) {
  char const* basename = std::strrchr(file, '/');
  basename = basename == nullptr ? file : basename + 1;
  std::ostringstream os;
  os << "[" << sev << "] " << message << " (" << basename << ":" << line << ")";
  return os.str();
}
} // namespace detail

} // namespace lf
