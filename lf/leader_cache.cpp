#include "lf/leader_cache.hpp"
#include <lf/assert_throw.hpp>

#include <mutex>
#include <sstream>

namespace lf {

std::string leader_address::url() const {
  std::ostringstream os;
  os << "http://" << host << ":" << port;
  return os.str();
}

leader_snapshot leader_cache::read() const {
  std::shared_lock<std::shared_timed_mutex> lock(mu_);
  return current_;
}

void leader_cache::write(leader_address address, std::chrono::steady_clock::time_point published) {
  LF_ASSERT_THROW(not address.empty());
  std::unique_lock<std::shared_timed_mutex> lock(mu_);
  current_.address = std::move(address);
  current_.published = published;
}

} // namespace lf
