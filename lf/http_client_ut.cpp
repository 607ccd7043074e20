#include "lf/http_client.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify header lookups ignore the case of the name.
 */
TEST(http_response, header_case_insensitive) {
  lf::http_response r;
  r.status = 307;
  r.headers.emplace_back("Content-Length", "0");
  r.headers.emplace_back("LOCATION", "http://leader:1234/scheduler");
  r.headers.emplace_back("location", "http://other:1234/scheduler");

  EXPECT_EQ(r.header("Location"), "http://leader:1234/scheduler");
  EXPECT_EQ(r.header("location"), "http://leader:1234/scheduler");
  EXPECT_EQ(r.header("content-length"), "0");
  EXPECT_EQ(r.header("Locatio"), "");
  EXPECT_EQ(r.header("Retry-After"), "");
}
