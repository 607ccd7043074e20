#include "lf/coordination_client.hpp"
#include <lf/log.hpp>

#include <gmock/gmock.h>

#include <sstream>

/**
 * @test Verify the event types can be printed.
 */
TEST(coordination_client, streaming) {
  std::ostringstream os;
  os << lf::watch_event_type::data_changed << " " << lf::watch_event_type::node_deleted << " "
     << lf::watch_event_type::watch_error << " " << lf::watch_event_type::channel_closed;
  EXPECT_EQ(os.str(), "data_changed node_deleted watch_error channel_closed");

  os.str("");
  os << lf::session_state::connecting << " " << lf::session_state::connected << " " << lf::session_state::expired
     << " " << lf::session_state::auth_failed << " " << lf::session_state::closed;
  EXPECT_EQ(os.str(), "connecting connected expired auth_failed closed");
}

/**
 * @test Verify session events are logged, and that losing the session is a warning.
 */
TEST(coordination_client, log_session_event) {
  std::vector<std::pair<lf::severity, std::string>> logs;
  lf::log::instance().add_sink(lf::make_log_sink(
      [&logs](lf::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); }));

  lf::log_session_event(lf::session_event{lf::session_state::connected, "zk1:2181"});
  lf::log_session_event(lf::session_event{lf::session_state::expired, "zk1:2181"});
  lf::log::instance().clear_sinks();

  using namespace ::testing;
  ASSERT_EQ(logs.size(), 2UL);
  EXPECT_EQ(logs[0].first, lf::severity::info);
  EXPECT_THAT(logs[0].second, HasSubstr("connected to zk1:2181"));
  EXPECT_EQ(logs[1].first, lf::severity::warning);
  EXPECT_THAT(logs[1].second, HasSubstr("expired"));
}
