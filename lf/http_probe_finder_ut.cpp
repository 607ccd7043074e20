#include "lf/http_probe_finder.hpp"
#include <lf/detail/mocked_http_client.hpp>
#include <lf/errors.hpp>

#include <gmock/gmock.h>

namespace {
lf::http_response redirect_to(std::string const& location) {
  lf::http_response r;
  r.status = 307;
  r.headers.emplace_back("Location", location);
  return r;
}
} // anonymous namespace

/**
 * @test Verify the Location header is turned into the leader base URL.
 */
TEST(http_probe_finder, redirect) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  auto client = std::make_shared<lf::detail::mocked_http_client>();
  EXPECT_CALL(*client, get("http://aurora.example.com:8081/scheduler", std::chrono::milliseconds(1500)))
      .WillOnce(Return(redirect_to("http://leader:1234/scheduler")));

  lf::http_probe_finder finder("http://aurora.example.com:8081", client, 1500ms);
  EXPECT_EQ(finder.leader_url(), "http://leader:1234");
}

/**
 * @test Verify only one literal suffix is removed, and only at the end.
 */
TEST(http_probe_finder, suffix_trim_is_literal) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  auto client = std::make_shared<lf::detail::mocked_http_client>();
  EXPECT_CALL(*client, get(_, _))
      .WillOnce(Return(redirect_to("http://leader:1234/scheduler/scheduler")))
      .WillOnce(Return(redirect_to("http://leader:1234/scheduler/")))
      .WillOnce(Return(redirect_to("http://leader:1234/aurora-scheduler")))
      .WillOnce(Return(redirect_to("http://leader:1234")));

  lf::http_probe_finder finder("http://aurora.example.com:8081", client, 1500ms);
  EXPECT_EQ(finder.leader_url(), "http://leader:1234/scheduler");
  EXPECT_EQ(finder.leader_url(), "http://leader:1234/scheduler/");
  EXPECT_EQ(finder.leader_url(), "http://leader:1234/aurora-");
  EXPECT_EQ(finder.leader_url(), "http://leader:1234");
}

/**
 * @test Verify a response without Location means the probed replica is the leader.
 */
TEST(http_probe_finder, no_redirect) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  auto client = std::make_shared<lf::detail::mocked_http_client>();
  lf::http_response ok;
  ok.status = 200;
  ok.headers.emplace_back("Content-Type", "text/html");
  EXPECT_CALL(*client, get(_, _)).WillOnce(Return(ok));

  lf::http_probe_finder finder("http://aurora.example.com:8081", client, 1500ms);
  EXPECT_EQ(finder.leader_url(), "http://aurora.example.com:8081/scheduler");
}

/**
 * @test Verify transport errors reach the caller, and that there are no retries.
 */
TEST(http_probe_finder, transport_error) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  auto client = std::make_shared<lf::detail::mocked_http_client>();
  EXPECT_CALL(*client, get(_, _))
      .WillOnce(Throw(lf::resolution_error("connection refused")))
      .WillOnce(Return(redirect_to("https://leader:1234/scheduler")));

  lf::http_probe_finder finder("http://aurora.example.com:8081", client, 1500ms);
  EXPECT_THROW(finder.leader_url(), lf::resolution_error);
  EXPECT_EQ(finder.leader_url(), "https://leader:1234");
}
