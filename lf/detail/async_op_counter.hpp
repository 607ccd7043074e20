#ifndef lf_detail_async_op_counter_hpp
#define lf_detail_async_op_counter_hpp

#include <condition_variable>
#include <mutex>

namespace lf {
namespace detail {

/**
 * Count the timers a watcher has in flight.
 *
 * The timer callbacks capture the watcher, so shutting it down must wait until every callback has run.  Once shutdown
 * starts no new operations are accepted.
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_(0)
      , shutdown_(false) {
  }

  /**
   * Register a new operation, @a name only shows up in the trace logs.
   *
   * @return false if the counter is shutting down, the caller must not start the operation.
   */
  bool async_op_start(char const* name);

  /// Unregister an operation, successful or cancelled.
  void async_op_done(char const* name);

  /// Reject any new operations.
  void shutdown();

  /**
   * Reject new operations and wait for the pending ones.
   *
   * Calling this from the thread running the callbacks deadlocks.
   */
  void block_until_all_done();

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int pending_;
  bool shutdown_;
};

} // namespace detail
} // namespace lf

#endif // lf_detail_async_op_counter_hpp
