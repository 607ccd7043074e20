#include "lf/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that lf::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  lf::severity sev = lf::severity::trace;
  auto ls = lf::make_log_sink([&value, &sev](lf::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(lf::severity::info, std::string("testing 1 2 3"));
  EXPECT_EQ(sev, lf::severity::info);
  EXPECT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that the ostream sink writes one line per message.
 */
TEST(log_sink, ostream) {
  std::ostringstream os;
  auto ls = lf::make_ostream_sink(os);
  ls->log(lf::severity::warning, std::string("[warning] first"));
  ls->log(lf::severity::error, std::string("[error] second"));
  EXPECT_EQ(os.str(), "[warning] first\n[error] second\n");
}
