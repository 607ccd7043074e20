#include "lf/log.hpp"

#include <gmock/gmock.h>

namespace {
using captured_logs = std::vector<std::pair<lf::severity, std::string>>;

std::shared_ptr<lf::log_sink> capture(captured_logs& logs) {
  return lf::make_log_sink([&logs](lf::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}

/// Count how many times the message arguments are evaluated.
struct counter {
  int calls = 0;
  int operator()() {
    return ++calls;
  }
};
} // anonymous namespace

/**
 * @test Verify the format of the log lines.
 */
TEST(log, format) {
  lf::log core;
  // ... without sinks nothing is formatted ...
  counter c;
  LF_LOG_I(error, core) << "value=" << c();
  EXPECT_EQ(c.calls, 0);

  captured_logs logs;
  core.add_sink(capture(logs));
  LF_LOG_I(warning, core) << "leader node " << "member_0000000002" << " at " << 8081;
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, lf::severity::warning);
  using namespace ::testing;
  EXPECT_THAT(logs[0].second, StartsWith("[warning] leader node member_0000000002 at 8081 (log_ut.cpp:"));
  EXPECT_THAT(logs[0].second, EndsWith(")"));
}

TEST(log, format_log_line) {
  EXPECT_EQ(
      lf::detail::format_log_line(lf::severity::info, "connected", "/src/lf/zookeeper_client.cpp", 42),
      "[info] connected (zookeeper_client.cpp:42)");
  EXPECT_EQ(lf::detail::format_log_line(lf::severity::error, "x", "finder.cpp", 7), "[error] x (finder.cpp:7)");
}

/**
 * @test Verify that messages below the run-time threshold are not formatted.
 */
TEST(log, run_time_threshold) {
  lf::log core;
  captured_logs logs;
  core.add_sink(capture(logs));
  core.min_severity(lf::severity::warning);
  EXPECT_FALSE(core.enabled(lf::severity::info));
  EXPECT_TRUE(core.enabled(lf::severity::warning));

  counter c;
  LF_LOG_I(info, core) << "value=" << c();
  EXPECT_TRUE(logs.empty());
  EXPECT_EQ(c.calls, 0);

  LF_LOG_I(error, core) << "value=" << c();
  EXPECT_EQ(logs.size(), 1UL);
  EXPECT_EQ(c.calls, 1);
}

/**
 * @test Verify that messages below LF_MIN_SEVERITY are compiled out.
 */
TEST(log, compile_time_threshold) {
  lf::log core;
  captured_logs logs;
  core.add_sink(capture(logs));
  core.min_severity(lf::severity::trace);

  counter c;
  LF_LOG_I(debug, core) << "value=" << c() << std::endl;
  EXPECT_TRUE(logs.empty());
  EXPECT_EQ(c.calls, 0);
  EXPECT_TRUE((std::is_same<
               decltype(std::declval<lf::log_line<lf::severity::trace>&>().stream()), lf::detail::null_stream&>::value));
}

/**
 * @test Verify LF_LOG() writes to the process-wide instance.
 */
TEST(log, instance) {
  lf::log& core = lf::log::instance();
  EXPECT_EQ(&core, &lf::log::instance());
  captured_logs logs;
  core.add_sink(capture(logs));

  LF_LOG(info) << "watching " << "/aurora/scheduler";
  core.clear_sinks();
  LF_LOG(info) << "not captured";

  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, lf::severity::info);
  EXPECT_THAT(logs[0].second, ::testing::StartsWith("[info] watching /aurora/scheduler"));
}

/**
 * @test Verify that every sink receives the message.
 */
TEST(log, multiple_sinks) {
  lf::log core;
  captured_logs first;
  captured_logs second;
  core.add_sink(capture(first));
  core.add_sink(capture(second));

  LF_LOG_I(error, core) << "testing " << 42;
  ASSERT_EQ(first.size(), 1UL);
  ASSERT_EQ(second.size(), 1UL);
  EXPECT_EQ(first[0].second, second[0].second);
}
