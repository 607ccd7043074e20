#include "lf/detail/async_op_counter.hpp"
#include <lf/log.hpp>

namespace lf {
namespace detail {

bool async_op_counter::async_op_start(char const* name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_) {
    LF_LOG(trace) << "rejected " << name << " during shutdown";
    return false;
  }
  ++pending_;
  LF_LOG(trace) << "started " << name << ", pending=" << pending_;
  return true;
}

void async_op_counter::async_op_done(char const* name) {
  std::unique_lock<std::mutex> lock(mu_);
  int remaining = --pending_;
  LF_LOG(trace) << "finished " << name << ", pending=" << remaining;
  lock.unlock();
  if (remaining == 0) {
    cv_.notify_all();
  }
}

void async_op_counter::shutdown() {
  std::lock_guard<std::mutex> lock(mu_);
  shutdown_ = true;
}

void async_op_counter::block_until_all_done() {
  std::unique_lock<std::mutex> lock(mu_);
  shutdown_ = true;
  cv_.wait(lock, [this]() { return pending_ == 0; });
}

} // namespace detail
} // namespace lf
