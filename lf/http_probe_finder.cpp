#include "lf/http_probe_finder.hpp"
#include <lf/log.hpp>

namespace lf {

char const scheduler_path[] = "/scheduler";

http_probe_finder::http_probe_finder(
    std::string base_url, std::shared_ptr<http_client> client, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url))
    , client_(std::move(client))
    , timeout_(timeout) {
}

std::string http_probe_finder::leader_url() {
  std::string scheduler_url = base_url_ + scheduler_path;
  auto response = client_->get(scheduler_url, timeout_);
  auto location = response.header("Location");
  if (location.empty()) {
    // ... the replica we reached is the leader, or the service does not redirect ...
    LF_LOG(debug) << "GET " << scheduler_url << " returned " << response.status << " without a Location header";
    return scheduler_url;
  }
  std::string suffix(scheduler_path);
  if (location.size() >= suffix.size() and
      location.compare(location.size() - suffix.size(), suffix.size(), suffix) == 0) {
    location.erase(location.size() - suffix.size());
  }
  LF_LOG(trace) << "GET " << scheduler_url << " redirected to " << location;
  return location;
}

} // namespace lf
