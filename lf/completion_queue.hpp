#ifndef lf_completion_queue_hpp
#define lf_completion_queue_hpp

#include <lf/detail/base_completion_queue.hpp>
#include <lf/detail/deadline_timer.hpp>
#include <lf/detail/default_grpc_interceptor.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace lf {

/**
 * Run timers on a gRPC completion queue.
 *
 * The refresh loop of lf::detail::coordination_watcher is a chain of timers, each callback schedules the next one.
 * The callbacks run in the thread calling run(), see lf::active_completion_queue.
 *
 * @tparam grpc_interceptor_t mediates all calls to the gRPC library.  The default inlines the calls, tests use
 * lf::detail::mocked_grpc_interceptor to control the timers.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /**
   * @name type traits
   */
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  /**
   * Call @a f at @a deadline.
   *
   * The functor receives the timer and a boolean, false if the timer was cancelled.  system_clock is not monotonic,
   * the delays in the refresh loop are long enough for this to not matter.
   *
   * @return the timer, to cancel it.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer>
  make_deadline_timer(std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto timer = std::make_shared<detail::deadline_timer>();
    timer->name = std::move(name);
    timer->deadline = deadline;
    timer->callback = std::forward<Functor>(f);
    void* tag = track(timer);
    interceptor_.make_deadline_timer(timer, cq(), tag);
    return timer;
  }

  /// Call @a f after @a delay.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(duration_type delay, std::string name, Functor&& f) {
    return make_deadline_timer(std::chrono::system_clock::now() + delay, std::move(name), std::forward<Functor>(f));
  }

  /**
   * Cancel a timer created by this queue.
   *
   * The callback still runs, with ok=false, unless the timer already expired.  Null timers are ignored.
   */
  void cancel_timer(std::shared_ptr<detail::deadline_timer> const& timer) {
    if (timer) {
      interceptor_.cancel_deadline_timer(timer);
    }
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

private:
  grpc_interceptor_type interceptor_;
};

} // namespace lf

#endif // lf_completion_queue_hpp
