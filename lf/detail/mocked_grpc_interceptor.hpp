#ifndef lf_detail_mocked_grpc_interceptor_hpp
#define lf_detail_mocked_grpc_interceptor_hpp

#include <lf/detail/deadline_timer.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>
#include <memory>

namespace lf {
namespace detail {

/**
 * Replace the grpc::Alarm objects in lf::completion_queue with gmock expectations.
 *
 * Nothing reaches the gRPC completion queue.  Tests capture the timers in the mock actions and call
 * timer->callback(*timer, ok) to simulate the deadline expiring (ok=true) or the timer being cancelled (ok=false).
 * The mock is shared, so copies of the interceptor (and of the queue) all report to the same expectations.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(std::make_shared<mocked>()) {
  }

  void make_deadline_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue*, void*) {
    shared_mock->make_deadline_timer(timer);
  }

  void cancel_deadline_timer(std::shared_ptr<deadline_timer> const& timer) {
    shared_mock->cancel_deadline_timer(timer);
  }

  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<deadline_timer>));
    MOCK_CONST_METHOD1(cancel_deadline_timer, void(std::shared_ptr<deadline_timer>));
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace lf

#endif // lf_detail_mocked_grpc_interceptor_hpp
