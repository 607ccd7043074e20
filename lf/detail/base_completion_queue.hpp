#ifndef lf_detail_base_completion_queue_hpp
#define lf_detail_base_completion_queue_hpp

#include <lf/detail/deadline_timer.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace lf {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The part of lf::completion_queue<> that does not depend on the interceptor.
 *
 * Owns the grpc::CompletionQueue and the timers posted to it.  Each timer is tagged with its own address, when gRPC
 * reports the tag the timer is removed from the table and its callback runs.
 */
class base_completion_queue {
public:
  /// How often run() checks if shutdown() was called.
  static std::chrono::milliseconds constexpr shutdown_poll_period{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Deliver the timers until shutdown() is called.
  void run();

  /// Stop run(), safe to call more than once.
  void shutdown();

  /// The number of timers waiting for delivery.
  std::size_t pending_timers() const;

protected:
  friend struct ::lf::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Keep @a timer until it is delivered, return the tag to post it with.
  void* track(std::shared_ptr<deadline_timer> timer);

private:
  /// Run the callback of the timer tagged with @a tag.
  void deliver(void* tag, bool ok);

private:
  mutable std::mutex mu_;
  std::unordered_map<void*, std::shared_ptr<deadline_timer>> timers_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace lf

#endif // lf_detail_base_completion_queue_hpp
