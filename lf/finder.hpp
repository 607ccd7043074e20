#ifndef lf_finder_hpp
#define lf_finder_hpp

#include <lf/coordination_client.hpp>
#include <lf/finder_config.hpp>
#include <lf/http_client.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lf {

/**
 * Find the current leader of a replicated service.
 *
 * Applications get one of the implementations from lf::make_finder() and only use this interface.
 */
class finder {
public:
  virtual ~finder() noexcept(false) = 0;

  /**
   * Return the base URL of the current leader, e.g. "http://10.0.0.1:8081".
   *
   * @throws lf::resolution_error if the leader cannot be determined.
   */
  virtual std::string leader_url() = 0;
};

/**
 * Create the client for a coordination ensemble.
 *
 * @param ensemble the "host:port" members of the ensemble.
 * @param config the timeouts and retry limits.
 * @param on_session called on each change in the session state.
 * @throws lf::connection_error if the ensemble cannot be reached.
 */
using coordination_client_factory = std::function<std::shared_ptr<coordination_client>(
    std::vector<std::string> const& ensemble, finder_config const& config,
    coordination_client::session_callback on_session)>;

/**
 * Create a finder for @a address.
 *
 * "http://" and "https://" addresses create an lf::http_probe_finder, no I/O happens until the first query.
 * "zk://" addresses connect to the ensemble using @a make_client and return an lf::watch_finder, without waiting for
 * the first refresh.
 *
 * @param address the discovery address.
 * @param config the finder configuration, validated before anything else.
 * @param make_client creates the coordination client in "zk://" mode.
 * @param http the client used by the probe finder, a lf::curl_http_client if null.
 * @throws lf::configuration_error if the address or the configuration are invalid.
 * @throws lf::connection_error if the ensemble cannot be reached.
 */
std::unique_ptr<finder> make_finder(
    std::string const& address, finder_config const& config, coordination_client_factory const& make_client,
    std::shared_ptr<http_client> http = std::shared_ptr<http_client>());

} // namespace lf

#endif // lf_finder_hpp
