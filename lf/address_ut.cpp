#include "lf/address.hpp"
#include <lf/errors.hpp>

#include <gmock/gmock.h>

/**
 * @test Verify that http and https addresses select the probe strategy.
 */
TEST(address, http_probe) {
  auto a = lf::parse_address("http://aurora.example.com:8081");
  EXPECT_EQ(a.mode, lf::discovery_mode::http_probe);
  EXPECT_EQ(a.base_url, "http://aurora.example.com:8081");
  EXPECT_TRUE(a.ensemble.empty());

  a = lf::parse_address("https://aurora.example.com/");
  EXPECT_EQ(a.mode, lf::discovery_mode::http_probe);
  EXPECT_EQ(a.base_url, "https://aurora.example.com");

  EXPECT_THROW(lf::parse_address("http://"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("https:///"), lf::configuration_error);
}

/**
 * @test Verify that zk:// addresses are parsed into ensemble members.
 */
TEST(address, coordination) {
  using namespace ::testing;
  auto a = lf::parse_address("zk://zk1:2181,zk2:2181,10.0.0.3:2182");
  EXPECT_EQ(a.mode, lf::discovery_mode::coordination);
  EXPECT_THAT(a.ensemble, ElementsAre("zk1:2181", "zk2:2181", "10.0.0.3:2182"));
  EXPECT_TRUE(a.election_path.empty());
  EXPECT_TRUE(a.base_url.empty());
  EXPECT_EQ(lf::ensemble_connect_string(a.ensemble), "zk1:2181,zk2:2181,10.0.0.3:2182");

  a = lf::parse_address("zk://zk1:2181,zk://zk2:2181");
  EXPECT_THAT(a.ensemble, ElementsAre("zk1:2181", "zk2:2181"));

  a = lf::parse_address("zk://[::1]:2181");
  EXPECT_THAT(a.ensemble, ElementsAre("[::1]:2181"));
}

/**
 * @test Verify that the election path can be given in the address.
 */
TEST(address, election_path) {
  using namespace ::testing;
  auto a = lf::parse_address("zk://zk1:2181,zk2:2181/aurora/prod/scheduler/");
  EXPECT_THAT(a.ensemble, ElementsAre("zk1:2181", "zk2:2181"));
  EXPECT_EQ(a.election_path, "/aurora/prod/scheduler");

  a = lf::parse_address("zk://zk1:2181,zk://zk2:2181/election");
  EXPECT_THAT(a.ensemble, ElementsAre("zk1:2181", "zk2:2181"));
  EXPECT_EQ(a.election_path, "/election");

  a = lf::parse_address("zk://zk1:2181/");
  EXPECT_TRUE(a.election_path.empty());
}

/**
 * @test Verify that malformed addresses fail with a configuration error.
 */
TEST(address, malformed) {
  EXPECT_THROW(lf::parse_address(""), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("ftp://host"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zookeeper://zk1:2181"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk:///aurora"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://:2181"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:21x1"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:0"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:65536"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:2181,,zk2:2181"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://zk1:2181,"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://[::1:2181"), lf::configuration_error);
  EXPECT_THROW(lf::parse_address("zk://[::1]2181"), lf::configuration_error);
}

/**
 * @test Verify the error message names the offending address.
 */
TEST(address, error_message) {
  using namespace ::testing;
  try {
    lf::parse_address("tcp://leader:1234");
    FAIL() << "parse_address() should have raised";
  } catch (lf::configuration_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("bad address"));
    EXPECT_THAT(ex.what(), HasSubstr("tcp://leader:1234"));
  }
}
