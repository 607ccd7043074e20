#ifndef lf_finder_config_hpp
#define lf_finder_config_hpp

#include <chrono>
#include <string>

namespace lf {

/// The election directory used when neither the configuration nor the address name one.
extern char const default_election_path[];

/**
 * Tune the finders.
 *
 * The defaults keep the staleness of a coordination-mode finder under a minute while polling the ensemble at most
 * once a second.
 */
struct finder_config {
  /// The election directory, overrides any path in the address when not empty.
  std::string election_path;

  /// Delay between refresh cycles, after a failure or after the leader node changed.
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);

  /// Maximum time to wait on the one-shot watch before refreshing anyway.
  std::chrono::milliseconds watch_timeout = std::chrono::seconds(10);

  /**
   * Queries fail once the cached leader is older than this.
   *
   * Zero disables the check.  When enabled it must be larger than watch_timeout, otherwise a healthy but idle
   * election would report stale data between refreshes.
   */
  std::chrono::milliseconds max_staleness = std::chrono::seconds(60);

  /// How long to wait for the first connection to the ensemble.
  std::chrono::milliseconds connect_timeout = std::chrono::seconds(20);

  /// The ZooKeeper session timeout proposed to the ensemble.
  std::chrono::milliseconds session_timeout = std::chrono::seconds(20);

  /// Timeout for each HTTP probe, including the connection.
  std::chrono::milliseconds http_timeout = std::chrono::seconds(10);

  /// How many times to retry creating the ZooKeeper handle.
  int connect_max_attempts = 5;

  /**
   * Verify the configuration is usable.
   *
   * @throws lf::configuration_error describing the first problem found.
   */
  void validate() const;
};

} // namespace lf

#endif // lf_finder_config_hpp
