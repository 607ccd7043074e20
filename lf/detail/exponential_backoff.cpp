#include "lf/detail/exponential_backoff.hpp"
#include <lf/errors.hpp>

#include <algorithm>
#include <sstream>

namespace lf {
namespace detail {

exponential_backoff::exponential_backoff(
    std::chrono::milliseconds initial, std::chrono::milliseconds maximum, int max_attempts)
    : initial_(initial)
    , maximum_(maximum)
    , max_attempts_(max_attempts)
    , next_(initial)
    , attempts_(0) {
  std::ostringstream os;
  if (initial_.count() <= 0) {
    os << "backoff initial delay must be positive, got " << initial_.count() << "ms";
  } else if (maximum_ < initial_) {
    os << "backoff maximum delay (" << maximum_.count() << "ms) is shorter than the initial delay ("
       << initial_.count() << "ms)";
  } else if (max_attempts_ <= 0) {
    os << "backoff needs at least one attempt, got " << max_attempts_;
  } else {
    return;
  }
  throw configuration_error(os.str());
}

std::chrono::milliseconds exponential_backoff::record_failure() {
  if (++attempts_ >= max_attempts_) {
    std::ostringstream os;
    os << "giving up after " << attempts_ << " attempts";
    throw connection_error(os.str());
  }
  auto delay = next_;
  next_ = std::min(2 * next_, maximum_);
  return delay;
}

} // namespace detail
} // namespace lf
