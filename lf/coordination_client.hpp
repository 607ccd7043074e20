#ifndef lf_coordination_client_hpp
#define lf_coordination_client_hpp

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace lf {

/// What ended a one-shot watch.
enum class watch_event_type {
  /// The data in the node changed.
  data_changed,
  /// The node was deleted.
  node_deleted,
  /// The coordination service reported an error on the watch.
  watch_error,
  /// The watch will never fire, e.g. the session expired or the client was closed.
  channel_closed,
};

std::ostream& operator<<(std::ostream& os, watch_event_type x);

/// A notification delivered, at most once, by a watch.
struct watch_event {
  watch_event_type type;
  /// The watched node.
  std::string path;
  /// Additional information, e.g. the error description.
  std::string detail;
};

/// The state of the connection between the client and the ensemble.
enum class session_state {
  connecting,
  connected,
  expired,
  auth_failed,
  closed,
};

std::ostream& operator<<(std::ostream& os, session_state x);

/// A change in the connection to the ensemble.
struct session_event {
  session_state state;
  /// The ensemble member the client is talking to, if known.
  std::string server;
};

/// Log a change in the coordination session, the refresh loop recovers on its own.
void log_session_event(session_event const& ev);

/**
 * The operations the finders need from a coordination service.
 *
 * The service is a black box: this interface hides the session management and the wire protocol.  Implementations
 * must be safe to use from multiple threads.
 */
class coordination_client {
public:
  //@{
  /// @name type traits
  /// Called at most once per registered watch, possibly from a thread owned by the client.
  using watch_callback = std::function<void(watch_event const&)>;
  /// Called for each connection state change, from a thread owned by the client.
  using session_callback = std::function<void(session_event const&)>;
  //@}

  virtual ~coordination_client() = default;

  /**
   * List the children of @a path.
   *
   * @throws lf::resolution_error if the listing fails.
   */
  virtual std::vector<std::string> get_children(std::string const& path) = 0;

  /**
   * Read the data in @a path and register a one-shot watch on it, in a single round-trip.
   *
   * @param path the node to read and watch.
   * @param on_change called at most once, when the node changes, is deleted, or the watch fails.  Not called if this
   *     function raises.
   * @return the data stored in the node, empty if the node has no data.
   * @throws lf::resolution_error if the read fails.
   * @throws lf::watch_interrupted if the node was deleted before it could be read.
   */
  virtual std::string get_data_and_watch(std::string const& path, watch_callback on_change) = 0;

  /**
   * Read the data in @a path without registering a watch.
   *
   * Used to refresh a node that already has a watch outstanding.
   *
   * @throws lf::resolution_error if the read fails.
   * @throws lf::watch_interrupted if the node no longer exists.
   */
  virtual std::string get_data(std::string const& path) = 0;
};

} // namespace lf

#endif // lf_coordination_client_hpp
