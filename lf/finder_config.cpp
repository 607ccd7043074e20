#include "lf/finder_config.hpp"
#include <lf/errors.hpp>

#include <sstream>

namespace {
void check_positive(char const* name, std::chrono::milliseconds value) {
  if (value.count() > 0) {
    return;
  }
  std::ostringstream os;
  os << "finder_config - " << name << " (" << value.count() << "ms) should be > 0";
  throw lf::configuration_error(os.str());
}
} // anonymous namespace

namespace lf {

char const default_election_path[] = "/aurora/scheduler";

void finder_config::validate() const {
  check_positive("poll_interval", poll_interval);
  check_positive("watch_timeout", watch_timeout);
  check_positive("connect_timeout", connect_timeout);
  check_positive("session_timeout", session_timeout);
  check_positive("http_timeout", http_timeout);
  if (max_staleness.count() < 0) {
    throw configuration_error("finder_config - max_staleness should be >= 0");
  }
  if (max_staleness.count() != 0 and max_staleness <= watch_timeout) {
    std::ostringstream os;
    os << "finder_config - max_staleness (" << max_staleness.count() << "ms) should be larger than watch_timeout ("
       << watch_timeout.count() << "ms)";
    throw configuration_error(os.str());
  }
  if (connect_max_attempts <= 0) {
    std::ostringstream os;
    os << "finder_config - connect_max_attempts (" << connect_max_attempts << ") should be > 0";
    throw configuration_error(os.str());
  }
  if (not election_path.empty() and election_path[0] != '/') {
    throw configuration_error("finder_config - election_path <" + election_path + "> should start with '/'");
  }
}

} // namespace lf
