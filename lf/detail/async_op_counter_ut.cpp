#include "lf/detail/async_op_counter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

/**
 * @test Verify new operations are rejected once the counter shuts down.
 */
TEST(async_op_counter, shutdown_rejects_operations) {
  lf::detail::async_op_counter counter;
  EXPECT_TRUE(counter.async_op_start("tick"));
  EXPECT_TRUE(counter.async_op_start("watch_timeout"));
  counter.async_op_done("watch_timeout");
  counter.async_op_done("tick");

  counter.shutdown();
  EXPECT_FALSE(counter.async_op_start("tick"));
  // ... nothing is pending, so this returns right away ...
  counter.block_until_all_done();
}

/**
 * @test Verify block_until_all_done() waits for operations completed in another thread.
 */
TEST(async_op_counter, block_until_all_done) {
  lf::detail::async_op_counter counter;
  ASSERT_TRUE(counter.async_op_start("tick"));
  ASSERT_TRUE(counter.async_op_start("watch_timeout"));

  std::atomic<int> done(0);
  std::thread t([&counter, &done]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ++done;
    counter.async_op_done("tick");
    ++done;
    counter.async_op_done("watch_timeout");
  });

  counter.block_until_all_done();
  EXPECT_EQ(done.load(), 2);
  EXPECT_FALSE(counter.async_op_start("tick"));
  t.join();
}

/**
 * @test Without pending operations block_until_all_done() returns immediately, and stops new operations.
 */
TEST(async_op_counter, block_when_idle) {
  lf::detail::async_op_counter counter;
  counter.block_until_all_done();
  EXPECT_FALSE(counter.async_op_start("tick"));
}
