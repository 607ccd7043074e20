#include "lf/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>

/**
 * @test Verify the loop thread stops when the queue is deleted.
 */
TEST(active_completion_queue, start_stop) {
  auto queue = std::make_unique<lf::active_completion_queue>();
  EXPECT_FALSE(queue->in_loop_thread());
  EXPECT_NO_THROW(queue.reset());
}

/**
 * @test Verify that timers run in the thread owned by the queue.
 */
TEST(active_completion_queue, timer_runs_in_loop_thread) {
  using namespace std::chrono_literals;
  lf::active_completion_queue queue;

  std::promise<bool> in_loop;
  queue.cq().make_relative_timer(
      1ms, "in-loop", [&queue, &in_loop](auto const&, bool ok) { in_loop.set_value(ok and queue.in_loop_thread()); });
  auto f = in_loop.get_future();
  ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(f.get());
}
