#include "lf/leader_cache.hpp"
#include <lf/errors.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <thread>
#include <vector>

/**
 * @test An empty cache reports no leader.
 */
TEST(leader_cache, initially_empty) {
  lf::leader_cache cache;
  auto s = cache.read();
  EXPECT_TRUE(s.address.empty());
  EXPECT_EQ(s.address.port, 0);
}

/**
 * @test A read returns exactly what the last write published.
 */
TEST(leader_cache, read_after_write) {
  lf::leader_cache cache;
  auto now = std::chrono::steady_clock::now();
  cache.write(lf::leader_address{"10.0.0.1", 8081}, now);
  auto s = cache.read();
  EXPECT_EQ(s.address.host, "10.0.0.1");
  EXPECT_EQ(s.address.port, 8081);
  EXPECT_EQ(s.published, now);
  EXPECT_EQ(s.address.url(), "http://10.0.0.1:8081");

  cache.write(lf::leader_address{"10.0.0.2", 8082});
  s = cache.read();
  EXPECT_EQ(s.address, (lf::leader_address{"10.0.0.2", 8082}));
  EXPECT_GE(s.published, now);
}

/**
 * @test The cache cannot be cleared.
 */
TEST(leader_cache, reject_empty_write) {
  lf::leader_cache cache;
  cache.write(lf::leader_address{"10.0.0.1", 8081});
  EXPECT_THROW(cache.write(lf::leader_address{}), lf::internal_error);
  EXPECT_EQ(cache.read().address, (lf::leader_address{"10.0.0.1", 8081}));
}

/**
 * @test Concurrent readers never observe a host from one write paired with the port from another.
 */
TEST(leader_cache, no_torn_reads) {
  int const advertisements = 64;
  int const readers = 8;
  int const rounds = 2000;
  // ... each advertisement i uses host "leader-i" and port 10000 + i, so a torn read is easy to detect ...
  std::vector<lf::leader_address> values;
  for (int i = 0; i != advertisements; ++i) {
    std::ostringstream os;
    os << "leader-" << i;
    values.push_back(lf::leader_address{os.str(), 10000 + i});
  }

  lf::leader_cache cache;
  std::atomic<bool> done(false);
  std::atomic<int> torn(0);
  std::atomic<long> observed(0);
  std::vector<std::thread> threads;
  for (int r = 0; r != readers; ++r) {
    threads.emplace_back([&]() {
      while (not done.load()) {
        auto s = cache.read();
        if (s.address.empty()) {
          if (s.address.port != 0) {
            ++torn;
          }
          continue;
        }
        std::ostringstream os;
        os << "leader-" << (s.address.port - 10000);
        if (os.str() != s.address.host) {
          ++torn;
        }
        ++observed;
      }
    });
  }

  for (int round = 0; round != rounds; ++round) {
    cache.write(values[round % advertisements]);
  }
  done.store(true);
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(cache.read().address, values[(rounds - 1) % advertisements]);
}
