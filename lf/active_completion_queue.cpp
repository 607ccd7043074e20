#include "lf/active_completion_queue.hpp"
#include <lf/log.hpp>

namespace lf {

active_completion_queue::active_completion_queue()
    : queue_()
    , loop_([this]() { queue_.run(); }) {
  LF_LOG(trace) << "refresh loop started";
}

active_completion_queue::~active_completion_queue() {
  queue_.shutdown();
  if (loop_.joinable()) {
    // ... a timer callback deleting the last reference to its own queue would join itself ...
    if (in_loop_thread()) {
      LF_LOG(error) << "active_completion_queue deleted from its own loop, detaching the thread";
      loop_.detach();
      return;
    }
    loop_.join();
  }
  LF_LOG(trace) << "refresh loop stopped";
}

} // namespace lf
