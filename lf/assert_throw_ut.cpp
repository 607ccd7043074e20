#include "lf/assert_throw.hpp"
#include <lf/errors.hpp>

#include <gmock/gmock.h>

/**
 * @test Verify that LF_ASSERT_THROW() only raises for false predicates.
 */
TEST(assert_throw, raises_when_false) {
  int members = 3;
  EXPECT_NO_THROW(LF_ASSERT_THROW(members > 0));
  EXPECT_THROW(LF_ASSERT_THROW(members == 0), lf::internal_error);
}

/**
 * @test Verify the message names the predicate and the location.
 */
TEST(assert_throw, message) {
  try {
    lf::raise_assertion_failure("port > 0", "leader_cache.cpp", 42);
    FAIL() << "raise_assertion_failure() returned";
  } catch (lf::internal_error const& ex) {
    EXPECT_STREQ(ex.what(), "internal error, (port > 0) is false at leader_cache.cpp:42");
  }
}
