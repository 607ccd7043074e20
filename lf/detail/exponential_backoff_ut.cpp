#include "lf/detail/exponential_backoff.hpp"
#include <lf/errors.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

/**
 * @test Verify invalid parameters are rejected.
 */
TEST(exponential_backoff, invalid_parameters) {
  using lf::detail::exponential_backoff;
  EXPECT_THROW(exponential_backoff(0ms, 1s, 3), lf::configuration_error);
  EXPECT_THROW(exponential_backoff(2s, 1s, 3), lf::configuration_error);
  EXPECT_THROW(exponential_backoff(100ms, 1s, 0), lf::configuration_error);
  EXPECT_NO_THROW(exponential_backoff(1s, 1s, 1));
}

/**
 * @test Verify the delay doubles up to the maximum, and the attempts are bounded.
 */
TEST(exponential_backoff, doubles_until_exhausted) {
  lf::detail::exponential_backoff backoff(100ms, 300ms, 5);
  EXPECT_EQ(backoff.record_failure(), 100ms);
  EXPECT_EQ(backoff.record_failure(), 200ms);
  EXPECT_EQ(backoff.record_failure(), 300ms);
  EXPECT_EQ(backoff.record_failure(), 300ms);
  EXPECT_THROW(backoff.record_failure(), lf::connection_error);
}
