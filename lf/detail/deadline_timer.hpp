#ifndef lf_detail_deadline_timer_hpp
#define lf_detail_deadline_timer_hpp

#include <grpc++/alarm.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace lf {
namespace detail {
/**
 * A timer posted to a lf::completion_queue.
 *
 * The queue keeps the timer alive until its callback runs, in the queue's thread: when the deadline expires (ok=true)
 * or once the timer is cancelled (ok=false).  Cancel timers through lf::completion_queue::cancel_timer().
 */
struct deadline_timer {
  /// Identifies the timer in the logs.
  std::string name;
  std::chrono::system_clock::time_point deadline;
  std::function<void(deadline_timer const&, bool)> callback;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};
} // namespace detail
} // namespace lf

#endif // lf_detail_deadline_timer_hpp
