#include "lf/finder.hpp"
#include <lf/address.hpp>
#include <lf/curl_http_client.hpp>
#include <lf/errors.hpp>
#include <lf/http_probe_finder.hpp>
#include <lf/log.hpp>
#include <lf/watch_finder.hpp>

namespace lf {

finder::~finder() noexcept(false) {
}

std::unique_ptr<finder> make_finder(
    std::string const& address, finder_config const& config, coordination_client_factory const& make_client,
    std::shared_ptr<http_client> http) {
  config.validate();
  auto parsed = parse_address(address);

  if (parsed.mode == discovery_mode::http_probe) {
    if (not http) {
      http = std::make_shared<curl_http_client>();
    }
    LF_LOG(info) << "probing " << parsed.base_url << " for the leader";
    return std::make_unique<http_probe_finder>(parsed.base_url, std::move(http), config.http_timeout);
  }

  // ... the configuration wins over the address, which wins over the default ...
  std::string election_path = config.election_path;
  if (election_path.empty()) {
    election_path = parsed.election_path.empty() ? std::string(default_election_path) : parsed.election_path;
  }
  if (not make_client) {
    throw configuration_error("no coordination client available for " + address);
  }
  auto client = make_client(parsed.ensemble, config, log_session_event);
  if (not client) {
    throw connection_error("cannot create a coordination client for " + ensemble_connect_string(parsed.ensemble));
  }
  LF_LOG(info) << "watching " << election_path << " on " << ensemble_connect_string(parsed.ensemble);
  auto queue = std::make_shared<active_completion_queue>();
  return std::make_unique<watch_finder>(std::move(queue), std::move(client), std::move(election_path), config);
}

} // namespace lf
