#ifndef lf_zookeeper_client_hpp
#define lf_zookeeper_client_hpp

#include <lf/coordination_client.hpp>
#include <lf/finder_config.hpp>

#include <zookeeper/zookeeper.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace lf {

/// The largest node the client reads, ZooKeeper rejects larger nodes anyway.
constexpr int max_node_size = 1 << 20;

/**
 * Implement lf::coordination_client on top of the ZooKeeper multi-threaded C client.
 *
 * The constructor blocks until the session is established.  The C client delivers events in its own thread, the
 * session events are forwarded to the session callback and the node events to the callback registered with
 * get_data_and_watch().  If the session expires the next call creates a new one.
 */
class zookeeper_client : public coordination_client {
public:
  /**
   * Connect to the ensemble in @a connect_string.
   *
   * zookeeper_init() is retried, with exponential backoff, up to config.connect_max_attempts times when the host names
   * cannot be resolved.
   *
   * @throws lf::connection_error if no session is established within config.connect_timeout.
   */
  zookeeper_client(std::string connect_string, finder_config const& config, session_callback on_session);
  ~zookeeper_client();

  zookeeper_client(zookeeper_client const&) = delete;
  zookeeper_client& operator=(zookeeper_client const&) = delete;

  /// An lf::coordination_client_factory creating objects of this class.
  static std::shared_ptr<coordination_client>
  create(std::vector<std::string> const& ensemble, finder_config const& config, session_callback on_session);

  std::vector<std::string> get_children(std::string const& path) override;

  /// @throws lf::watch_interrupted if the node does not exist.
  std::string get_data_and_watch(std::string const& path, watch_callback on_change) override;

  /// @throws lf::watch_interrupted if the node does not exist.
  std::string get_data(std::string const& path) override;

  /// The last session state reported by the C client.
  session_state state() const;

private:
  struct pending_watch {
    zookeeper_client* client;
    watch_callback callback;
  };

  /// Create the handle and wait for the session, the caller holds handle_mu_.
  void connect();
  /// Close the handle and end its pending watches with channel_closed, the caller holds handle_mu_.
  void close();
  /// Replace an expired session, the caller holds handle_mu_.
  void ensure_session();

  static void on_session_event(zhandle_t* zh, int type, int state, char const* path, void* context);
  static void on_node_event(zhandle_t* zh, int type, int state, char const* path, void* context);

private:
  std::string const connect_string_;
  finder_config const config_;
  session_callback on_session_;

  /// Serializes the calls using the handle, and the reconnections.
  std::mutex handle_mu_;
  zhandle_t* zh_;

  /// Protects the session state and the pending watches, the C client thread takes it.
  mutable std::mutex mu_;
  std::condition_variable cv_;
  session_state state_;
  std::unordered_map<pending_watch*, std::unique_ptr<pending_watch>> watches_;
};

} // namespace lf

#endif // lf_zookeeper_client_hpp
