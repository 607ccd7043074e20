#include "lf/detail/base_completion_queue.hpp"
#include <lf/assert_throw.hpp>
#include <lf/log.hpp>

namespace lf {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::shutdown_poll_period;

base_completion_queue::base_completion_queue()
    : mu_()
    , timers_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto const& t : timers_) {
    // ... the callbacks may reference deleted objects, only report them ...
    LF_LOG(error) << "completion queue deleted with pending timer " << t.second->name;
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto status = queue_.AsyncNext(&tag, &ok, std::chrono::system_clock::now() + shutdown_poll_period);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      LF_LOG(trace) << "completion queue drained";
      return;
    }
    if (status == grpc::CompletionQueue::GOT_EVENT and tag != nullptr) {
      deliver(tag, ok);
    }
  }
}

void base_completion_queue::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }
  LF_LOG(trace) << "shutting down completion queue";
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_timers() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timers_.size();
}

void* base_completion_queue::track(std::shared_ptr<deadline_timer> timer) {
  void* tag = timer.get();
  std::lock_guard<std::mutex> lock(mu_);
  auto inserted = timers_.emplace(tag, std::move(timer)).second;
  LF_ASSERT_THROW(inserted);
  return tag;
}

void base_completion_queue::deliver(void* tag, bool ok) {
  std::shared_ptr<deadline_timer> timer;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto f = timers_.find(tag);
    if (f == timers_.end()) {
      LF_LOG(error) << "completion queue got an unknown tag " << tag;
      return;
    }
    timer = std::move(f->second);
    timers_.erase(f);
  }
  // ... an exception escaping here would terminate the loop thread, and with it the refresh loop ...
  try {
    timer->callback(*timer, ok);
  } catch (std::exception const& ex) {
    LF_LOG(error) << "timer " << timer->name << " callback raised: " << ex.what();
  }
}

} // namespace detail
} // namespace lf
