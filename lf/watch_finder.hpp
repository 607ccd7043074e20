#ifndef lf_watch_finder_hpp
#define lf_watch_finder_hpp

#include <lf/active_completion_queue.hpp>
#include <lf/coordination_client.hpp>
#include <lf/finder.hpp>
#include <lf/finder_config.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lf {
namespace detail {
template <typename completion_queue_type>
class coordination_watcher;
} // namespace detail

/**
 * Find the leader by watching the election directory in a coordination service.
 *
 * A background loop keeps the leader address cached, queries only read the cache.  The loop starts in the
 * constructor and stops in shutdown() or in the destructor.
 */
class watch_finder : public finder {
public:
  //@{
  /// @name type traits
  using subscriber_type = std::function<void(std::string const& leader_url)>;
  //@}

  watch_finder(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<coordination_client> client,
      std::string election_path, finder_config const& config);

  ~watch_finder() noexcept(false);

  //@{
  /// @name Implement the finder interface using the pimpl idiom.
  std::string leader_url() override;
  //@}

  /// The election directory being watched.
  std::string const& election_path() const;

  /// Return true once a leader was published.
  bool has_leader() const;

  /**
   * Call @a subscriber each time a different leader is published.
   *
   * The subscriber runs in the background thread and must not call shutdown() or destroy this object.
   *
   * @return a token for unsubscribe()
   */
  long subscribe(subscriber_type&& subscriber);
  void unsubscribe(long token);

  /// Stop the background loop, blocks until it is done.  Queries keep returning the cached leader.
  void shutdown();

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<coordination_client> client_;
  std::shared_ptr<detail::coordination_watcher<completion_queue<>>> watcher_;
};

} // namespace lf

#endif // lf_watch_finder_hpp
