#include "lf/curl_http_client.hpp"
#include <lf/errors.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify transport failures are reported as resolution errors.
 */
TEST(curl_http_client, connection_refused) {
  using namespace std::chrono_literals;
  lf::curl_http_client client;
  // ... nothing listens on port 1 of the loopback interface ...
  EXPECT_THROW(client.get("http://127.0.0.1:1/scheduler", 2000ms), lf::resolution_error);
}

/**
 * @test Verify malformed URLs are reported as resolution errors.
 */
TEST(curl_http_client, bad_url) {
  using namespace std::chrono_literals;
  lf::curl_http_client client;
  EXPECT_THROW(client.get("notaprotocol://leader/scheduler", 2000ms), lf::resolution_error);
}
