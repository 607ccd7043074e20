#include "lf/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>
#include <future>
#include <thread>

/**
 * @test Verify that run() returns after shutdown(), and that shutdown() can be called more than once.
 */
TEST(base_completion_queue, run_shutdown) {
  lf::detail::base_completion_queue queue;
  EXPECT_EQ(queue.pending_timers(), 0UL);

  std::promise<void> end;
  std::thread t([&]() {
    queue.run();
    end.set_value();
  });

  queue.shutdown();
  EXPECT_NO_THROW(queue.shutdown());

  auto end_fut = end.get_future();
  EXPECT_EQ(end_fut.wait_for(10 * lf::detail::base_completion_queue::shutdown_poll_period), std::future_status::ready);
  t.join();
}
