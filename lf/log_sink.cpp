#include "lf/log_sink.hpp"

#include <ostream>

namespace lf {

void ostream_sink::log(severity sev, std::string&& message) {
  std::lock_guard<std::mutex> lock(mu_);
  os_ << message << std::endl;
}

} // namespace lf
