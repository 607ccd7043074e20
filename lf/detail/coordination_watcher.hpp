#ifndef lf_detail_coordination_watcher_hpp
#define lf_detail_coordination_watcher_hpp

#include <lf/advertisement.hpp>
#include <lf/coordination_client.hpp>
#include <lf/detail/async_op_counter.hpp>
#include <lf/detail/deadline_timer.hpp>
#include <lf/errors.hpp>
#include <lf/finder_config.hpp>
#include <lf/leader_cache.hpp>
#include <lf/leader_node.hpp>
#include <lf/log.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace lf {
namespace detail {

/**
 * Keep the leader of an election directory in a lf::leader_cache.
 *
 * Each refresh cycle runs in the completion queue thread:
 *   - list the election directory and select the member with the lowest sequence number,
 *   - read the member node and register a one-shot watch on it,
 *   - decode the advertisement and publish it to the cache,
 *   - wait for the watch, or for config.watch_timeout, whichever happens first.
 * A failure at any step is logged and the next cycle runs after config.poll_interval, the cache keeps the last good
 * value.
 *
 * Each cycle has a generation number and exactly one continuation is scheduled per cycle.  At most one watch is
 * outstanding: while the leader node keeps its watch, the cycles that end with watch_timeout read it with get_data().
 * Events from replaced watches are ignored.  Watch callbacks hold only a std::weak_ptr to the watcher, so objects of
 * this class must be owned by a std::shared_ptr.
 *
 * @tparam completion_queue_type the queue running the timers, typically lf::completion_queue<>.
 */
template <typename completion_queue_type>
class coordination_watcher : public std::enable_shared_from_this<coordination_watcher<completion_queue_type>> {
public:
  //@{
  /// @name type traits
  using subscriber_type = std::function<void(std::string const& leader_url)>;
  //@}

  coordination_watcher(
      std::string election_path, finder_config const& config, completion_queue_type& queue,
      std::shared_ptr<coordination_client> client)
      : election_path_(std::move(election_path))
      , config_(config)
      , queue_(queue)
      , client_(std::move(client))
      , cache_()
      , mu_()
      , generation_(0)
      , cycle_done_(true)
      , timer_()
      , watch_id_gen_(0)
      , active_watch_(0)
      , watched_node_()
      , subscriptions_mu_()
      , subscriptions_()
      , token_gen_(0)
      , published_version_(0)
      , published_url_()
      , ops_() {
  }

  ~coordination_watcher() noexcept(false) {
    shutdown();
  }

  /// Start the refresh loop, the first cycle runs as soon as the completion queue picks it up.
  void startup() {
    std::lock_guard<std::mutex> lock(mu_);
    schedule_tick(std::chrono::milliseconds(0));
  }

  /**
   * Stop the refresh loop.
   *
   * No new cycles start, the pending timer is cancelled, and the call blocks until the timer callbacks complete.  Do
   * not call from the completion queue thread, e.g. from a subscriber.
   */
  void shutdown() {
    ops_.shutdown();
    std::shared_ptr<deadline_timer> pending;
    {
      std::lock_guard<std::mutex> lock(mu_);
      pending = std::move(timer_);
      timer_.reset();
    }
    queue_.cancel_timer(pending);
    ops_.block_until_all_done();
  }

  std::string const& election_path() const {
    return election_path_;
  }

  /// Return true if a leader was ever published.
  bool has_leader() const {
    return not cache_.read().address.empty();
  }

  /**
   * Return the URL of the cached leader.
   *
   * @throws lf::resolution_error if no leader was published yet, or if the last publication is older than
   *     config.max_staleness.
   */
  std::string leader_url() const {
    auto snapshot = cache_.read();
    if (snapshot.address.empty()) {
      throw resolution_error("no leader found in " + election_path_);
    }
    if (config_.max_staleness.count() > 0) {
      auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - snapshot.published);
      if (age > config_.max_staleness) {
        std::ostringstream os;
        os << "leader information for " << election_path_ << " is stale, last refreshed " << age.count()
           << "ms ago, limit is " << config_.max_staleness.count() << "ms";
        throw resolution_error(os.str());
      }
    }
    return snapshot.address.url();
  }

  /**
   * Get notified when the leader URL changes.
   *
   * The subscriber is called right away if a leader is known, and then each time a different leader is published,
   * usually from the completion queue thread.  The calls for one subscriber never overlap and the last call always
   * carries the latest leader.
   *
   * @return a token for unsubscribe().
   */
  long subscribe(subscriber_type&& subscriber) {
    long token;
    {
      std::lock_guard<std::mutex> lock(subscriptions_mu_);
      token = ++token_gen_;
      auto s = std::make_shared<subscription>();
      s->callback = std::move(subscriber);
      subscriptions_.emplace(token, std::move(s));
    }
    deliver(token);
    return token;
  }

  void unsubscribe(long token) {
    std::lock_guard<std::mutex> lock(subscriptions_mu_);
    subscriptions_.erase(token);
  }

private:
  /// Schedule a refresh after @a delay, the caller holds mu_.
  void schedule_tick(std::chrono::milliseconds delay) {
    if (not ops_.async_op_start("coordination_watcher/tick")) {
      return;
    }
    timer_ = queue_.make_relative_timer(
        delay, "coordination_watcher/tick", [this](auto const&, bool ok) { this->on_tick(ok); });
  }

  /// Schedule the end of the watch wait, the caller holds mu_.
  void schedule_watch_timeout(std::uint64_t generation) {
    if (not ops_.async_op_start("coordination_watcher/watch_timeout")) {
      return;
    }
    timer_ = queue_.make_relative_timer(
        config_.watch_timeout, "coordination_watcher/watch_timeout",
        [this, generation](auto const&, bool ok) { this->on_watch_timeout(generation, ok); });
  }

  void on_tick(bool ok) {
    if (ok) {
      refresh();
    }
    ops_.async_op_done("coordination_watcher/tick");
  }

  void on_watch_timeout(std::uint64_t generation, bool ok) {
    if (ok and claim_cycle(generation)) {
      LF_LOG(debug) << "no change on " << election_path_ << " after " << config_.watch_timeout.count()
                    << "ms, refreshing";
      refresh();
    }
    ops_.async_op_done("coordination_watcher/watch_timeout");
  }

  /// Called from the coordination client thread.
  void on_watch_event(std::uint64_t watch_id, watch_event const& ev) {
    std::unique_lock<std::mutex> lock(mu_);
    if (watch_id != active_watch_) {
      LF_LOG(trace) << "ignoring replaced watch event " << ev.type << " on " << ev.path;
      return;
    }
    active_watch_ = 0;
    watched_node_.clear();
    if (cycle_done_) {
      // ... a retry is already scheduled, it registers a new watch ...
      return;
    }
    cycle_done_ = true;
    LF_LOG(info) << "leader node " << ev.path << " " << ev.type << (ev.detail.empty() ? "" : ": ") << ev.detail;
    auto pending = std::move(timer_);
    timer_.reset();
    schedule_tick(config_.poll_interval);
    lock.unlock();
    queue_.cancel_timer(pending);
  }

  /// Return true if the continuation of cycle @a generation was not scheduled yet, and mark it as scheduled.
  bool claim_cycle(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mu_);
    if (generation != generation_ or cycle_done_) {
      return false;
    }
    cycle_done_ = true;
    timer_.reset();
    return true;
  }

  /// Run one refresh cycle, always leaves exactly one continuation scheduled (unless shutting down).
  void refresh() {
    std::uint64_t generation;
    {
      std::lock_guard<std::mutex> lock(mu_);
      generation = ++generation_;
      cycle_done_ = false;
      timer_.reset();
    }
    std::string node;
    leader_advertisement advertisement;
    try {
      node = select_leader_node(election_path_, client_->get_children(election_path_));
      advertisement = decode_advertisement(read_leader_node(node));
    } catch (finder_error const& ex) {
      LF_LOG(warning) << "cannot refresh leader of " << election_path_ << (node.empty() ? "" : " from ") << node << ": "
                      << ex.what();
      retry_later(generation);
      return;
    } catch (std::exception const& ex) {
      LF_LOG(error) << "unexpected error refreshing leader of " << election_path_ << ": " << ex.what();
      retry_later(generation);
      return;
    }
    publish(node, advertisement);

    std::lock_guard<std::mutex> lock(mu_);
    if (cycle_done_) {
      // ... the watch fired while publishing, it scheduled the next tick ...
      return;
    }
    schedule_watch_timeout(generation);
  }

  /**
   * Read @a node, registering a watch unless it already has one.
   *
   * The watch is recorded as active before the call, its event may arrive before the call returns.
   */
  std::string read_leader_node(std::string const& node) {
    std::uint64_t id;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (active_watch_ != 0 and watched_node_ == node) {
        id = 0;
      } else {
        id = ++watch_id_gen_;
        active_watch_ = id;
        watched_node_ = node;
      }
    }
    if (id == 0) {
      return client_->get_data(node);
    }
    std::weak_ptr<coordination_watcher> self = this->shared_from_this();
    try {
      return client_->get_data_and_watch(node, [self, id](watch_event const& ev) {
        if (auto watcher = self.lock()) {
          watcher->on_watch_event(id, ev);
        }
      });
    } catch (std::exception const&) {
      // ... the watch was not registered ...
      std::lock_guard<std::mutex> lock(mu_);
      if (active_watch_ == id) {
        active_watch_ = 0;
        watched_node_.clear();
      }
      throw;
    }
  }

  void retry_later(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mu_);
    if (generation != generation_ or cycle_done_) {
      return;
    }
    cycle_done_ = true;
    schedule_tick(config_.poll_interval);
  }

  void publish(std::string const& node, leader_advertisement const& advertisement) {
    leader_address address{advertisement.host, advertisement.port};
    auto previous = cache_.read();
    cache_.write(address);
    if (previous.address == address) {
      LF_LOG(trace) << "leader of " << election_path_ << " unchanged at " << address.url();
      return;
    }
    LF_LOG(info) << "leader of " << election_path_ << " is " << address.url() << " (" << node << ", status "
                 << advertisement.status << ")";
    std::vector<long> tokens;
    {
      std::lock_guard<std::mutex> lock(subscriptions_mu_);
      ++published_version_;
      published_url_ = address.url();
      tokens.reserve(subscriptions_.size());
      for (auto const& p : subscriptions_) {
        tokens.push_back(p.first);
      }
    }
    for (auto token : tokens) {
      deliver(token);
    }
  }

  /**
   * Bring subscriber @a token up to date with the published leader.
   *
   * Only one thread delivers to a given subscriber, others leave the newer leader to it.  The subscriber runs without
   * any lock held, it may subscribe, unsubscribe, or trigger a refresh.
   */
  void deliver(long token) {
    std::unique_lock<std::mutex> lock(subscriptions_mu_);
    auto f = subscriptions_.find(token);
    if (f == subscriptions_.end() or f->second->delivering) {
      return;
    }
    auto s = f->second;
    s->delivering = true;
    while (s->delivered < published_version_ and subscriptions_.count(token) != 0) {
      s->delivered = published_version_;
      auto url = published_url_;
      lock.unlock();
      try {
        s->callback(url);
      } catch (std::exception const& ex) {
        LF_LOG(error) << "subscriber " << token << " raised: " << ex.what();
      }
      lock.lock();
    }
    s->delivering = false;
  }

private:
  std::string const election_path_;
  finder_config const config_;
  completion_queue_type& queue_;
  std::shared_ptr<coordination_client> client_;
  leader_cache cache_;

  /// Protects the cycle state.
  mutable std::mutex mu_;
  std::uint64_t generation_;
  bool cycle_done_;
  std::shared_ptr<deadline_timer> timer_;
  std::uint64_t watch_id_gen_;
  /// The watch whose events end the await step, 0 if none is outstanding.
  std::uint64_t active_watch_;
  std::string watched_node_;

  struct subscription {
    subscriber_type callback;
    /// The published_version_ last passed to the callback.
    std::uint64_t delivered = 0;
    bool delivering = false;
  };
  std::mutex subscriptions_mu_;
  std::unordered_map<long, std::shared_ptr<subscription>> subscriptions_;
  long token_gen_;
  /// Incremented each time a different leader is published, 0 until the first one.
  std::uint64_t published_version_;
  std::string published_url_;

  async_op_counter ops_;
};

} // namespace detail
} // namespace lf

#endif // lf_detail_coordination_watcher_hpp
