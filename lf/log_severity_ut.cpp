#include "lf/log_severity.hpp"
#include <lf/errors.hpp>

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify that the severity names are what we expect.
 */
TEST(log_severity, streaming) {
  std::ostringstream os;
  os << lf::severity::trace << " " << lf::severity::warning << " " << lf::severity::fatal;
  EXPECT_EQ(os.str(), "trace warning fatal");
}

/**
 * @test Verify that every severity name can be parsed back.
 */
TEST(log_severity, parse) {
  for (int i = int(lf::severity::LOWEST); i <= int(lf::severity::HIGHEST); ++i) {
    std::ostringstream os;
    os << lf::severity(i);
    EXPECT_EQ(lf::parse_severity(os.str()), lf::severity(i));
  }
  EXPECT_THROW(lf::parse_severity("verbose"), lf::configuration_error);
  EXPECT_THROW(lf::parse_severity(""), lf::configuration_error);
  EXPECT_THROW(lf::parse_severity("WARNING"), lf::configuration_error);
}
