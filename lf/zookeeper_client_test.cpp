#include "lf/zookeeper_client.hpp"
#include <lf/errors.hpp>
#include <lf/make_finder.hpp>
#include <lf/watch_finder.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace {
std::string const zookeeper_address = "localhost:2181";

/// Keep polling @a predicate with exponential backoff, for a few seconds at most.
template <typename Predicate>
void sleep_until(Predicate predicate) {
  using namespace std::chrono_literals;
  auto s = 10ms;
  for (int i = 0; i != 10; ++i) {
    if (predicate()) {
      return;
    }
    std::this_thread::sleep_for(s);
    s *= 2;
  }
}

void ignore_events(zhandle_t*, int, int, char const*, void*) {
}

/// Play the role of the election members with a separate session.
class election_member_session {
public:
  election_member_session()
      : zh_(zookeeper_init(zookeeper_address.c_str(), &ignore_events, 10000, nullptr, nullptr, 0)) {
    sleep_until([this]() { return zh_ != nullptr and zoo_state(zh_) == ZOO_CONNECTED_STATE; });
  }
  ~election_member_session() {
    if (zh_ != nullptr) {
      zookeeper_close(zh_);
    }
  }

  bool connected() const {
    return zh_ != nullptr and zoo_state(zh_) == ZOO_CONNECTED_STATE;
  }

  /// Create a persistent node, ignoring ZNODEEXISTS.
  void create_directory(std::string const& path) {
    int rc = zoo_create(zh_, path.c_str(), nullptr, -1, &ZOO_OPEN_ACL_UNSAFE, 0, nullptr, 0);
    ASSERT_TRUE(rc == ZOK or rc == ZNODEEXISTS) << "zoo_create(" << path << ") failed: " << zerror(rc);
  }

  /// Create an ephemeral-sequential member node, return its path.
  std::string join(std::string const& directory, std::string const& payload) {
    std::string prefix = directory + "/member_";
    char buffer[1024];
    int rc = zoo_create(
        zh_, prefix.c_str(), payload.data(), static_cast<int>(payload.size()), &ZOO_OPEN_ACL_UNSAFE,
        ZOO_EPHEMERAL | ZOO_SEQUENCE, buffer, sizeof(buffer));
    EXPECT_EQ(rc, ZOK) << "zoo_create(" << prefix << ") failed: " << zerror(rc);
    return rc == ZOK ? std::string(buffer) : std::string();
  }

  void leave(std::string const& path) {
    int rc = zoo_delete(zh_, path.c_str(), -1);
    EXPECT_EQ(rc, ZOK) << "zoo_delete(" << path << ") failed: " << zerror(rc);
  }

private:
  zhandle_t* zh_;
};

std::string advertisement(std::string const& host, int port) {
  std::ostringstream os;
  os << R"""({"serviceEndpoint": {"host": ")""" << host << R"""(", "port": )""" << port
     << R"""(}, "additionalEndpoints": {}, "status": "ALIVE"})""";
  return os.str();
}

std::string unique_directory() {
  std::ostringstream os;
  os << "/lf-test-" << std::hex << std::chrono::system_clock::now().time_since_epoch().count();
  return os.str();
}
} // anonymous namespace

/**
 * @test Verify the client can list and read nodes, and that watches fire.
 */
TEST(zookeeper_client, basic) {
  election_member_session members;
  ASSERT_TRUE(members.connected());
  auto directory = unique_directory();
  members.create_directory(directory);
  auto node = members.join(directory, advertisement("10.0.0.1", 8081));

  lf::zookeeper_client client(zookeeper_address, lf::finder_config(), lf::log_session_event);
  EXPECT_EQ(client.state(), lf::session_state::connected);

  auto children = client.get_children(directory);
  ASSERT_EQ(children.size(), 1UL);
  EXPECT_EQ(directory + "/" + children[0], node);

  std::mutex mu;
  std::vector<lf::watch_event> events;
  auto data = client.get_data_and_watch(node, [&mu, &events](lf::watch_event const& ev) {
    std::lock_guard<std::mutex> lock(mu);
    events.push_back(ev);
  });
  EXPECT_EQ(data, advertisement("10.0.0.1", 8081));
  EXPECT_EQ(client.get_data(node), advertisement("10.0.0.1", 8081));

  members.leave(node);
  sleep_until([&mu, &events]() {
    std::lock_guard<std::mutex> lock(mu);
    return not events.empty();
  });
  std::lock_guard<std::mutex> lock(mu);
  ASSERT_EQ(events.size(), 1UL);
  EXPECT_EQ(events[0].type, lf::watch_event_type::node_deleted);
  EXPECT_EQ(events[0].path, node);

  EXPECT_THROW(client.get_data_and_watch(node, [](lf::watch_event const&) {}), lf::watch_interrupted);
  EXPECT_THROW(client.get_data(node), lf::watch_interrupted);
  EXPECT_THROW(client.get_children(directory + "/does-not-exist"), lf::resolution_error);
}

/**
 * @test Verify a finder follows the leader as members come and go.
 */
TEST(zookeeper_client, finder_follows_leader) {
  election_member_session members;
  ASSERT_TRUE(members.connected());
  auto directory = unique_directory();
  members.create_directory(directory);
  auto first = members.join(directory, advertisement("10.0.0.1", 8081));
  auto second = members.join(directory, advertisement("10.0.0.2", 8082));

  using namespace std::chrono_literals;
  lf::finder_config config;
  config.poll_interval = 50ms;
  config.election_path = directory;
  auto finder = lf::make_finder("zk://" + zookeeper_address, config);

  sleep_until([&finder]() {
    try {
      return finder->leader_url() == "http://10.0.0.1:8081";
    } catch (lf::resolution_error const&) {
      return false;
    }
  });
  EXPECT_EQ(finder->leader_url(), "http://10.0.0.1:8081");

  members.leave(first);
  sleep_until([&finder]() { return finder->leader_url() == "http://10.0.0.2:8082"; });
  EXPECT_EQ(finder->leader_url(), "http://10.0.0.2:8082");

  // ... with no members left the last leader is kept ...
  members.leave(second);
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(finder->leader_url(), "http://10.0.0.2:8082");
}

/**
 * @test Verify unreachable ensembles are reported as connection errors.
 */
TEST(zookeeper_client, connect_timeout) {
  using namespace std::chrono_literals;
  lf::finder_config config;
  config.connect_timeout = 500ms;
  EXPECT_THROW(lf::zookeeper_client("127.0.0.1:1", config, lf::log_session_event), lf::connection_error);
}
