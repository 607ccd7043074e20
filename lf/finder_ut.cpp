#include "lf/finder.hpp"
#include <lf/detail/mocked_coordination_client.hpp>
#include <lf/detail/mocked_http_client.hpp>
#include <lf/errors.hpp>
#include <lf/http_probe_finder.hpp>
#include <lf/watch_finder.hpp>

#include <gmock/gmock.h>

#include <condition_variable>
#include <mutex>

namespace {
using ::testing::NiceMock;
using lf::detail::mocked_coordination_client;

/// Record the arguments of the factory calls and return a canned client.
struct recording_factory {
  std::shared_ptr<lf::coordination_client> client = std::make_shared<NiceMock<mocked_coordination_client>>();
  std::vector<std::string> ensemble;
  int calls = 0;

  lf::coordination_client_factory factory() {
    return [this](std::vector<std::string> const& e, lf::finder_config const&, lf::coordination_client::session_callback) {
      ++calls;
      ensemble = e;
      return client;
    };
  }
};
} // anonymous namespace

/**
 * @test Verify bad addresses and configurations are rejected before any connection.
 */
TEST(make_finder, configuration_errors) {
  recording_factory f;
  EXPECT_THROW(lf::make_finder("ftp://host", lf::finder_config(), f.factory()), lf::configuration_error);
  EXPECT_THROW(lf::make_finder("zk://host:0", lf::finder_config(), f.factory()), lf::configuration_error);
  EXPECT_THROW(lf::make_finder("zk://", lf::finder_config(), f.factory()), lf::configuration_error);

  lf::finder_config config;
  config.poll_interval = std::chrono::milliseconds(0);
  EXPECT_THROW(lf::make_finder("zk://host:2181", config, f.factory()), lf::configuration_error);
  EXPECT_EQ(f.calls, 0);

  EXPECT_THROW(
      lf::make_finder("zk://host:2181", lf::finder_config(), lf::coordination_client_factory()),
      lf::configuration_error);
}

/**
 * @test Verify HTTP addresses create a probe finder.
 */
TEST(make_finder, http_probe) {
  using namespace ::testing;
  recording_factory f;
  auto http = std::make_shared<lf::detail::mocked_http_client>();
  lf::http_response r;
  r.status = 307;
  r.headers.emplace_back("location", "http://leader:1234/scheduler");
  EXPECT_CALL(*http, get("https://aurora.example.com/scheduler", _)).WillOnce(Return(r));

  auto finder = lf::make_finder("https://aurora.example.com/", lf::finder_config(), f.factory(), http);
  ASSERT_TRUE(dynamic_cast<lf::http_probe_finder*>(finder.get()) != nullptr);
  EXPECT_EQ(finder->leader_url(), "http://leader:1234");
  EXPECT_EQ(f.calls, 0);
}

/**
 * @test Verify how the election directory is chosen.
 */
TEST(make_finder, election_path_priority) {
  recording_factory f;
  {
    auto finder = lf::make_finder("zk://zk1:2181,zk2:2181", lf::finder_config(), f.factory());
    auto* w = dynamic_cast<lf::watch_finder*>(finder.get());
    ASSERT_TRUE(w != nullptr);
    EXPECT_EQ(w->election_path(), "/aurora/scheduler");
    EXPECT_EQ(f.ensemble, (std::vector<std::string>{"zk1:2181", "zk2:2181"}));
  }
  {
    auto finder = lf::make_finder("zk://zk1:2181/services/leader", lf::finder_config(), f.factory());
    auto* w = dynamic_cast<lf::watch_finder*>(finder.get());
    ASSERT_TRUE(w != nullptr);
    EXPECT_EQ(w->election_path(), "/services/leader");
  }
  {
    lf::finder_config config;
    config.election_path = "/configured";
    auto finder = lf::make_finder("zk://zk1:2181/services/leader", config, f.factory());
    auto* w = dynamic_cast<lf::watch_finder*>(finder.get());
    ASSERT_TRUE(w != nullptr);
    EXPECT_EQ(w->election_path(), "/configured");
  }
  EXPECT_EQ(f.calls, 3);
}

/**
 * @test Verify connection failures reach the caller.
 */
TEST(make_finder, connection_error) {
  auto factory = [](std::vector<std::string> const&, lf::finder_config const&,
                    lf::coordination_client::session_callback) -> std::shared_ptr<lf::coordination_client> {
    throw lf::connection_error("cannot connect");
  };
  EXPECT_THROW(lf::make_finder("zk://zk1:2181", lf::finder_config(), factory), lf::connection_error);
}

/**
 * @test Verify a coordination-mode finder resolves the leader in the background.
 */
TEST(make_finder, watch_end_to_end) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  auto client = std::make_shared<NiceMock<mocked_coordination_client>>();
  ON_CALL(*client, get_children("/aurora/scheduler"))
      .WillByDefault(Return(std::vector<std::string>{"member_0000000005", "member_0000000002", "member_0000000009"}));
  ON_CALL(*client, get_data_and_watch("/aurora/scheduler/member_0000000002", _))
      .WillByDefault(Return(std::string(
          R"""({"serviceEndpoint": {"host": "10.0.0.1", "port": 8081}, "additionalEndpoints": {"http": {"host": "10.0.0.1", "port": 8081}}, "status": "ALIVE"})""")));

  lf::finder_config config;
  config.poll_interval = 10ms;
  auto factory = [client](std::vector<std::string> const&, lf::finder_config const&,
                          lf::coordination_client::session_callback) { return client; };
  auto finder = lf::make_finder("zk://zk1:2181", config, factory);
  auto* w = dynamic_cast<lf::watch_finder*>(finder.get());
  ASSERT_TRUE(w != nullptr);

  std::mutex mu;
  std::condition_variable cv;
  std::string url;
  w->subscribe([&](std::string const& u) {
    std::lock_guard<std::mutex> lock(mu);
    url = u;
    cv.notify_one();
  });
  {
    std::unique_lock<std::mutex> lock(mu);
    EXPECT_TRUE(cv.wait_for(lock, 5s, [&url]() { return not url.empty(); }));
  }
  EXPECT_TRUE(w->has_leader());
  EXPECT_EQ(finder->leader_url(), "http://10.0.0.1:8081");

  // ... queries keep working after the loop stops ...
  w->shutdown();
  EXPECT_EQ(finder->leader_url(), "http://10.0.0.1:8081");
  EXPECT_NO_THROW(finder.reset());
}
