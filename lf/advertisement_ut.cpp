#include "lf/advertisement.hpp"
#include <lf/errors.hpp>

#include <gmock/gmock.h>

/**
 * @test Decode a typical advertisement.
 */
TEST(advertisement, basic) {
  auto a = lf::decode_advertisement(R"""({
      "serviceEndpoint": {"host": "10.0.0.1", "port": 8081},
      "additionalEndpoints": {
        "http": {"host": "10.0.0.1", "port": 8081},
        "thrift": {"host": "10.0.0.1", "port": 9090}
      },
      "status": "ALIVE"
    })""");
  EXPECT_EQ(a.host, "10.0.0.1");
  EXPECT_EQ(a.port, 8081);
  EXPECT_EQ(a.status, "ALIVE");
}

/**
 * @test Unknown fields and a missing status are accepted.
 */
TEST(advertisement, lenient) {
  auto a = lf::decode_advertisement(
      R"""({"serviceEndpoint": {"host": "leader", "port": 1234, "weight": 3}, "shard": 7, "member_id": "x"})""");
  EXPECT_EQ(a.host, "leader");
  EXPECT_EQ(a.port, 1234);
  EXPECT_EQ(a.status, "");

  // ... the original field names are also accepted by the JSON parser ...
  a = lf::decode_advertisement(R"""({"service_endpoint": {"host": "leader", "port": 1234}})""");
  EXPECT_EQ(a.host, "leader");
}

/**
 * @test The SOH placeholder is a decode failure, not an empty address.
 */
TEST(advertisement, sentinel) {
  EXPECT_STREQ(lf::invalid_advertisement, "\x01");
  EXPECT_THROW(lf::decode_advertisement(std::string("\x01")), lf::decode_error);
  try {
    lf::decode_advertisement(lf::invalid_advertisement);
    FAIL() << "decode_advertisement() accepted the placeholder";
  } catch (lf::decode_error const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("SOH"));
  }
}

/**
 * @test Malformed payloads are decode failures.
 */
TEST(advertisement, malformed) {
  EXPECT_THROW(lf::decode_advertisement(""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement("not json"), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": )"""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": {"host": 42, "port": 1}})"""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": {"host": "h", "port": "x"}})"""), lf::decode_error);
}

/**
 * @test An advertisement without a usable endpoint is rejected.
 */
TEST(advertisement, missing_endpoint) {
  EXPECT_THROW(lf::decode_advertisement("{}"), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"status": "ALIVE"})"""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": {"port": 8081}})"""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": {"host": "h"}})"""), lf::decode_error);
  EXPECT_THROW(lf::decode_advertisement(R"""({"serviceEndpoint": {"host": "h", "port": 70000}})"""), lf::decode_error);
}
