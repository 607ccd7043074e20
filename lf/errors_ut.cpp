#include "lf/errors.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify the error taxonomy, callers rely on catching the base classes.
 */
TEST(errors, hierarchy) {
  EXPECT_THROW(throw lf::not_found_error("no leader node"), lf::resolution_error);
  EXPECT_THROW(throw lf::resolution_error("no leader found"), lf::finder_error);
  EXPECT_THROW(throw lf::configuration_error("bad address"), lf::finder_error);
  EXPECT_THROW(throw lf::connection_error("timeout"), lf::finder_error);
  EXPECT_THROW(throw lf::decode_error("SOH"), lf::finder_error);
  EXPECT_THROW(throw lf::watch_interrupted("deleted"), lf::finder_error);
  EXPECT_THROW(throw lf::finder_error("x"), std::runtime_error);
  EXPECT_THROW(throw lf::internal_error("x"), std::logic_error);

  lf::configuration_error e("bad address");
  EXPECT_STREQ(e.what(), "bad address");
}
