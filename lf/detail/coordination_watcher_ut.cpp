#define LF_MIN_SEVERITY trace
#include "lf/detail/coordination_watcher.hpp"
#include <lf/completion_queue.hpp>
#include <lf/detail/mocked_coordination_client.hpp>
#include <lf/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = lf::completion_queue<lf::detail::mocked_grpc_interceptor>;
using watcher_type = lf::detail::coordination_watcher<completion_queue_type>;
using lf::detail::mocked_coordination_client;

char const leader_payload[] =
    R"""({"serviceEndpoint": {"host": "10.0.0.1", "port": 8081}, "additionalEndpoints": {}, "status": "ALIVE"})""";
char const other_payload[] =
    R"""({"serviceEndpoint": {"host": "10.0.0.2", "port": 8082}, "additionalEndpoints": {}, "status": "ALIVE"})""";

/// Capture the timers created by the watcher, cancelling a timer runs its callback with ok=false.
class mocked_timers {
public:
  using timer_ptr = std::shared_ptr<lf::detail::deadline_timer>;

  explicit mocked_timers(completion_queue_type& queue) {
    using namespace ::testing;
    EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
        .WillRepeatedly(Invoke([this](timer_ptr t) { pending.push_back(t); }));
    EXPECT_CALL(*queue.interceptor().shared_mock, cancel_deadline_timer(_)).WillRepeatedly(Invoke([this](timer_ptr t) {
      auto f = std::find(pending.begin(), pending.end(), t);
      if (f == pending.end()) {
        return;
      }
      pending.erase(f);
      ++cancelled;
      t->callback(*t, false);
    }));
  }

  /// Fire the oldest pending timer, return its name.
  std::string fire() {
    if (pending.empty()) {
      return "";
    }
    auto t = pending.front();
    pending.erase(pending.begin());
    t->callback(*t, true);
    return t->name;
  }

  std::vector<timer_ptr> pending;
  int cancelled = 0;
};

/// A fake election directory backed by the mocked client.
struct fake_election {
  explicit fake_election(mocked_coordination_client& client)
      : children({"member_5", "member_2", "member_9"}) {
    using namespace ::testing;
    EXPECT_CALL(client, get_children("/aurora/scheduler")).WillRepeatedly(Invoke([this](std::string const&) {
      if (list_fails) {
        throw lf::resolution_error("connection loss");
      }
      return children;
    }));
    EXPECT_CALL(client, get_data_and_watch(_, _))
        .WillRepeatedly(Invoke([this](std::string const& path, lf::coordination_client::watch_callback cb) {
          auto f = payloads.find(path);
          if (f == payloads.end()) {
            throw lf::watch_interrupted(path + " was deleted");
          }
          watches.push_back(std::move(cb));
          return f->second;
        }));
    EXPECT_CALL(client, get_data(_)).WillRepeatedly(Invoke([this](std::string const& path) {
      ++plain_reads;
      auto f = payloads.find(path);
      if (f == payloads.end()) {
        throw lf::watch_interrupted(path + " was deleted");
      }
      return f->second;
    }));
  }

  std::vector<std::string> children;
  std::map<std::string, std::string> payloads;
  std::vector<lf::coordination_client::watch_callback> watches;
  bool list_fails = false;
  int plain_reads = 0;
};

lf::finder_config test_config() {
  lf::finder_config config;
  config.max_staleness = std::chrono::milliseconds(0);
  return config;
}
} // anonymous namespace

/**
 * @test Verify the first cycle publishes the member with the lowest sequence number.
 */
TEST(coordination_watcher, publish_lowest_member) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  EXPECT_FALSE(watcher->has_leader());
  EXPECT_THROW(watcher->leader_url(), lf::resolution_error);

  watcher->startup();
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.fire(), "coordination_watcher/tick");

  EXPECT_TRUE(watcher->has_leader());
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
  ASSERT_EQ(election.watches.size(), 1UL);
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/watch_timeout");

  watcher->shutdown();
  EXPECT_TRUE(timers.pending.empty());
  EXPECT_EQ(timers.cancelled, 1);
}

/**
 * @test Verify the cache keeps the last leader when the leader node is deleted and no member remains.
 */
TEST(coordination_watcher, deleted_leader_keeps_cache) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();
  ASSERT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
  ASSERT_EQ(election.watches.size(), 1UL);

  // ... the leader goes away, the watch cancels the timeout and schedules a tick ...
  election.children.clear();
  election.payloads.clear();
  election.watches[0](lf::watch_event{lf::watch_event_type::node_deleted, "/aurora/scheduler/member_2", ""});
  EXPECT_EQ(timers.cancelled, 1);
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");

  // ... the next cycle finds no members, the cache is untouched and the loop keeps going ...
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");

  // ... a new leader shows up ...
  election.children = {"member_11"};
  election.payloads["/aurora/scheduler/member_11"] = other_payload;
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.2:8082");
}

/**
 * @test Verify that failures in each step of the cycle schedule a retry and leave the cache alone.
 */
TEST(coordination_watcher, failures_retry) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.list_fails = true;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();
  EXPECT_FALSE(watcher->has_leader());
  ASSERT_EQ(timers.pending.size(), 1UL);

  // ... the listing works but the node vanished before it was read ...
  election.list_fails = false;
  timers.fire();
  EXPECT_FALSE(watcher->has_leader());
  ASSERT_EQ(timers.pending.size(), 1UL);

  // ... the node holds the placeholder payload ...
  election.payloads["/aurora/scheduler/member_2"] = lf::invalid_advertisement;
  timers.fire();
  EXPECT_FALSE(watcher->has_leader());
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");

  // ... a watch registered by the failed cycle must not start a second chain of timers ...
  ASSERT_EQ(election.watches.size(), 1UL);
  election.watches[0](lf::watch_event{lf::watch_event_type::data_changed, "/aurora/scheduler/member_2", ""});
  EXPECT_EQ(timers.pending.size(), 1UL);

  // ... a non-numeric member poisons the whole selection ...
  election.children.push_back("member_abc");
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;
  timers.fire();
  EXPECT_FALSE(watcher->has_leader());
  ASSERT_EQ(timers.pending.size(), 1UL);

  election.children.pop_back();
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
}

/**
 * @test Verify that watches replaced after a leader change are ignored.
 */
TEST(coordination_watcher, stale_watch_ignored) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();
  ASSERT_EQ(election.watches.size(), 1UL);

  // ... a member with a lower sequence takes over before the old watch fires ...
  election.children.push_back("member_1");
  election.payloads["/aurora/scheduler/member_1"] = other_payload;
  EXPECT_EQ(timers.fire(), "coordination_watcher/watch_timeout");
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.2:8082");
  ASSERT_EQ(election.watches.size(), 2UL);
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/watch_timeout");

  election.watches[0](lf::watch_event{lf::watch_event_type::node_deleted, "/aurora/scheduler/member_2", ""});
  EXPECT_EQ(timers.cancelled, 0);
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/watch_timeout");

  election.watches[1](lf::watch_event{lf::watch_event_type::watch_error, "/aurora/scheduler/member_1", "lost"});
  EXPECT_EQ(timers.cancelled, 1);
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");

  // ... firing the same watch twice has no effect either ...
  election.watches[1](lf::watch_event{lf::watch_event_type::channel_closed, "/aurora/scheduler/member_1", ""});
  EXPECT_EQ(timers.pending.size(), 1UL);

  // ... the next cycle registers a new watch on the same node ...
  EXPECT_EQ(timers.fire(), "coordination_watcher/tick");
  EXPECT_EQ(election.watches.size(), 3UL);
}

/**
 * @test Verify a stable leader keeps a single watch across many watch timeouts.
 */
TEST(coordination_watcher, single_watch_per_node) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  EXPECT_EQ(timers.fire(), "coordination_watcher/tick");
  for (int i = 0; i != 100; ++i) {
    ASSERT_EQ(timers.fire(), "coordination_watcher/watch_timeout");
  }
  EXPECT_EQ(election.watches.size(), 1UL);
  EXPECT_EQ(election.plain_reads, 100);

  // ... the refreshes still pick up new data ...
  election.payloads["/aurora/scheduler/member_2"] = other_payload;
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.2:8082");
  EXPECT_EQ(election.watches.size(), 1UL);

  // ... and the original watch still ends the wait ...
  election.watches[0](lf::watch_event{lf::watch_event_type::data_changed, "/aurora/scheduler/member_2", ""});
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");
}

/**
 * @test Verify the node read without a watch reports deletions like any other failure.
 */
TEST(coordination_watcher, unwatched_read_fails) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();

  election.payloads.clear();
  EXPECT_EQ(timers.fire(), "coordination_watcher/watch_timeout");
  EXPECT_EQ(election.plain_reads, 1);
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
  ASSERT_EQ(timers.pending.size(), 1UL);
  EXPECT_EQ(timers.pending.front()->name, "coordination_watcher/tick");

  // ... the watch on the deleted node ends, and the next cycles do not leak new ones ...
  election.watches[0](lf::watch_event{lf::watch_event_type::node_deleted, "/aurora/scheduler/member_2", ""});
  EXPECT_EQ(timers.pending.size(), 1UL);
  election.payloads["/aurora/scheduler/member_2"] = other_payload;
  timers.fire();
  EXPECT_EQ(election.watches.size(), 2UL);
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.2:8082");
}

/**
 * @test Verify subscribers are told about changes, and only about changes.
 */
TEST(coordination_watcher, subscriptions) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  std::vector<std::string> observed;
  auto token = watcher->subscribe([&observed](std::string const& url) { observed.push_back(url); });
  watcher->subscribe([](std::string const&) { throw std::runtime_error("bad subscriber"); });

  watcher->startup();
  timers.fire();
  ASSERT_EQ(observed.size(), 1UL);
  EXPECT_EQ(observed.back(), "http://10.0.0.1:8081");

  // ... the failing subscriber does not stop the loop ...
  ASSERT_EQ(timers.pending.size(), 1UL);

  // ... refreshing the same leader is not a change ...
  timers.fire();
  EXPECT_EQ(observed.size(), 1UL);

  election.payloads["/aurora/scheduler/member_2"] = other_payload;
  timers.fire();
  ASSERT_EQ(observed.size(), 2UL);
  EXPECT_EQ(observed.back(), "http://10.0.0.2:8082");

  // ... late subscribers get the current leader right away ...
  std::vector<std::string> late;
  watcher->subscribe([&late](std::string const& url) { late.push_back(url); });
  ASSERT_EQ(late.size(), 1UL);
  EXPECT_EQ(late.back(), "http://10.0.0.2:8082");

  watcher->unsubscribe(token);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;
  timers.fire();
  EXPECT_EQ(observed.size(), 2UL);
  EXPECT_EQ(late.size(), 2UL);
}

/**
 * @test Verify a subscriber learns about a leader published while its first call runs.
 */
TEST(coordination_watcher, subscribe_during_publish) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();
  ASSERT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");

  std::vector<std::string> seen;
  watcher->subscribe([&](std::string const& url) {
    seen.push_back(url);
    if (seen.size() == 1) {
      // ... the refresh loop publishes a new leader before the first call returns ...
      election.payloads["/aurora/scheduler/member_2"] = other_payload;
      timers.fire();
    }
  });

  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.2:8082");
  ASSERT_EQ(seen.size(), 2UL);
  EXPECT_EQ(seen[0], "http://10.0.0.1:8081");
  EXPECT_EQ(seen[1], "http://10.0.0.2:8082");
}

/**
 * @test Verify concurrent publications and subscriptions leave every subscriber on the latest leader.
 */
TEST(coordination_watcher, subscribe_races_refresh) {
  using namespace std::chrono_literals;
  using namespace ::testing;
  lf::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  std::mutex payload_mu;
  int reads = 0;
  // ... alternate between two leaders on every read ...
  EXPECT_CALL(*client, get_data_and_watch(_, _))
      .WillRepeatedly(Invoke([&](std::string const&, lf::coordination_client::watch_callback) {
        std::lock_guard<std::mutex> lock(payload_mu);
        return std::string(++reads % 2 == 0 ? leader_payload : other_payload);
      }));
  EXPECT_CALL(*client, get_data(_)).WillRepeatedly(Invoke([&](std::string const&) {
    std::lock_guard<std::mutex> lock(payload_mu);
    return std::string(++reads % 2 == 0 ? leader_payload : other_payload);
  }));

  auto config = test_config();
  config.poll_interval = 1ms;
  config.watch_timeout = 1ms;
  using real_watcher_type = lf::detail::coordination_watcher<lf::completion_queue<>>;
  auto watcher = std::make_shared<real_watcher_type>("/aurora/scheduler", config, queue, client);
  watcher->startup();

  std::vector<std::shared_ptr<std::string>> last;
  std::mutex last_mu;
  for (int i = 0; i != 20; ++i) {
    auto value = std::make_shared<std::string>();
    last.push_back(value);
    watcher->subscribe([value, &last_mu](std::string const& url) {
      std::lock_guard<std::mutex> lock(last_mu);
      *value = url;
    });
    std::this_thread::sleep_for(1ms);
  }

  watcher->shutdown();
  auto current = watcher->leader_url();
  std::lock_guard<std::mutex> lock(last_mu);
  for (auto const& v : last) {
    EXPECT_EQ(*v, current);
  }
  queue.shutdown();
  t.join();
}

/**
 * @test Verify queries fail once the cached leader is too old.
 */
TEST(coordination_watcher, bounded_staleness) {
  using namespace std::chrono_literals;
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto config = test_config();
  config.watch_timeout = 5ms;
  config.max_staleness = 20ms;
  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", config, queue, client);
  watcher->startup();
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");

  std::this_thread::sleep_for(50ms);
  EXPECT_THROW(watcher->leader_url(), lf::resolution_error);
  EXPECT_TRUE(watcher->has_leader());

  // ... a successful refresh makes the data fresh again ...
  timers.fire();
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");
}

/**
 * @test Verify shutdown stops the loop and late watches are ignored.
 */
TEST(coordination_watcher, shutdown) {
  completion_queue_type queue;
  mocked_timers timers(queue);
  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto watcher = std::make_shared<watcher_type>("/aurora/scheduler", test_config(), queue, client);
  watcher->startup();
  timers.fire();
  ASSERT_EQ(timers.pending.size(), 1UL);

  watcher->shutdown();
  EXPECT_TRUE(timers.pending.empty());
  EXPECT_EQ(timers.cancelled, 1);

  // ... idempotent ...
  EXPECT_NO_THROW(watcher->shutdown());

  // ... a watch arriving after shutdown does not schedule anything ...
  ASSERT_EQ(election.watches.size(), 1UL);
  election.watches[0](lf::watch_event{lf::watch_event_type::channel_closed, "/aurora/scheduler/member_2", ""});
  EXPECT_TRUE(timers.pending.empty());

  // ... and neither does a watch arriving after the watcher is gone ...
  auto cb = election.watches[0];
  watcher.reset();
  EXPECT_NO_THROW(cb(lf::watch_event{lf::watch_event_type::node_deleted, "/aurora/scheduler/member_2", ""}));
  EXPECT_TRUE(timers.pending.empty());
}

/**
 * @test Verify the watcher runs against a real completion queue.
 */
TEST(coordination_watcher, real_queue) {
  using namespace std::chrono_literals;
  lf::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  auto client = std::make_shared<mocked_coordination_client>();
  fake_election election(*client);
  election.payloads["/aurora/scheduler/member_2"] = leader_payload;

  auto config = test_config();
  config.poll_interval = 10ms;
  using real_watcher_type = lf::detail::coordination_watcher<lf::completion_queue<>>;
  auto watcher = std::make_shared<real_watcher_type>("/aurora/scheduler", config, queue, client);

  std::mutex mu;
  std::condition_variable cv;
  std::string url;
  watcher->subscribe([&](std::string const& u) {
    std::lock_guard<std::mutex> lock(mu);
    url = u;
    cv.notify_one();
  });
  watcher->startup();
  {
    std::unique_lock<std::mutex> lock(mu);
    EXPECT_TRUE(cv.wait_for(lock, 5s, [&url]() { return not url.empty(); }));
  }
  EXPECT_EQ(watcher->leader_url(), "http://10.0.0.1:8081");

  watcher->shutdown();
  queue.shutdown();
  t.join();
}
