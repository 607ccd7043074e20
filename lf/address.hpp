#ifndef lf_address_hpp
#define lf_address_hpp

#include <string>
#include <vector>

namespace lf {

/// The discovery strategy selected by the address scheme.
enum class discovery_mode {
  /// Probe a stable HTTP endpoint that redirects to the leader.
  http_probe,
  /// Watch a ZooKeeper election directory.
  coordination,
};

/**
 * A parsed discovery address.
 *
 * Two forms are recognized:
 *
 * @code
 * http://host[:port]                              -> http_probe
 * https://host[:port]                             -> http_probe
 * zk://host1:port1,host2:port2[/election/path]    -> coordination
 * @endcode
 *
 * In the coordination form each ensemble member may repeat the zk:// scheme, so "zk://a:2181,zk://b:2181" is also
 * accepted.
 */
struct finder_address {
  discovery_mode mode = discovery_mode::http_probe;

  /// The probe base URL, without trailing slashes.  Empty in coordination mode.
  std::string base_url;

  /// The ensemble members as "host:port" strings.  Empty in probe mode.
  std::vector<std::string> ensemble;

  /// The election directory named in the address, empty if none.
  std::string election_path;
};

/**
 * Parse a discovery address.
 *
 * @throws lf::configuration_error if the scheme is not recognized or an ensemble member is malformed.
 */
finder_address parse_address(std::string const& address);

/// Format the ensemble as the comma-separated list expected by zookeeper_init().
std::string ensemble_connect_string(std::vector<std::string> const& ensemble);

} // namespace lf

#endif // lf_address_hpp
