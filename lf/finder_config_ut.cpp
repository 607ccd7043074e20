#include "lf/finder_config.hpp"
#include <lf/errors.hpp>

#include <gtest/gtest.h>

/**
 * @test The defaults are valid.
 */
TEST(finder_config, defaults) {
  lf::finder_config config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_TRUE(config.election_path.empty());
  EXPECT_EQ(config.poll_interval.count(), 1000);
  EXPECT_STREQ(lf::default_election_path, "/aurora/scheduler");
}

/**
 * @test Verify each validation rule.
 */
TEST(finder_config, validate) {
  using namespace std::chrono_literals;
  {
    lf::finder_config config;
    config.poll_interval = 0ms;
    EXPECT_THROW(config.validate(), lf::configuration_error);
  }
  {
    lf::finder_config config;
    config.http_timeout = -1ms;
    EXPECT_THROW(config.validate(), lf::configuration_error);
  }
  {
    lf::finder_config config;
    config.max_staleness = config.watch_timeout;
    EXPECT_THROW(config.validate(), lf::configuration_error);
  }
  {
    lf::finder_config config;
    config.max_staleness = 0ms;
    EXPECT_NO_THROW(config.validate());
  }
  {
    lf::finder_config config;
    config.connect_max_attempts = 0;
    EXPECT_THROW(config.validate(), lf::configuration_error);
  }
  {
    lf::finder_config config;
    config.election_path = "aurora/scheduler";
    EXPECT_THROW(config.validate(), lf::configuration_error);
    config.election_path = "/aurora/scheduler";
    EXPECT_NO_THROW(config.validate());
  }
}
