#ifndef lf_active_completion_queue_hpp
#define lf_active_completion_queue_hpp

#include <lf/completion_queue.hpp>
#include <thread>

namespace lf {

/**
 * A completion_queue running in its own thread.
 *
 * Each lf::watch_finder owns one, the thread runs the refresh loop of the watcher.  The destructor shuts the queue
 * down and joins the thread, the watcher must be shut down before that.
 */
class active_completion_queue {
public:
  active_completion_queue();
  ~active_completion_queue();

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  completion_queue<>& cq() {
    return queue_;
  }

  /// True when called from a timer callback.
  bool in_loop_thread() const {
    return std::this_thread::get_id() == loop_.get_id();
  }

private:
  completion_queue<> queue_;
  std::thread loop_;
};

} // namespace lf

#endif // lf_active_completion_queue_hpp
