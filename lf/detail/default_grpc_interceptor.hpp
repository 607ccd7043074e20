#ifndef lf_detail_default_grpc_interceptor_hpp
#define lf_detail_default_grpc_interceptor_hpp

#include <lf/detail/deadline_timer.hpp>

#include <grpc++/grpc++.h>
#include <memory>

namespace lf {
namespace detail {

/**
 * Post the timers of a lf::completion_queue as grpc::Alarm objects.
 *
 * Tests replace this class with lf::detail::mocked_grpc_interceptor to fire (or cancel) the timers on demand.
 */
struct default_grpc_interceptor {
  void make_deadline_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue* cq, void* tag) {
    timer->alarm_ = std::make_unique<grpc::Alarm>();
    timer->alarm_->Set(cq, timer->deadline, tag);
  }

  /// The completion queue delivers the timer with ok=false, unless it already expired.
  void cancel_deadline_timer(std::shared_ptr<deadline_timer> const& timer) {
    if (timer->alarm_) {
      timer->alarm_->Cancel();
    }
  }
};

} // namespace detail
} // namespace lf

#endif // lf_detail_default_grpc_interceptor_hpp
