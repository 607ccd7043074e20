#include "lf/completion_queue.hpp"
#include <lf/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace lf {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace lf

namespace {
/// Poll @a predicate for up to a second.
template <typename Predicate>
bool eventually(Predicate predicate) {
  using namespace std::chrono_literals;
  for (int i = 0; i != 100; ++i) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}
} // anonymous namespace

/**
 * @test Verify that timers fire, and cancelled timers report ok=false.
 */
TEST(completion_queue, timers) {
  lf::completion_queue<> queue;

  std::atomic<int> fired(0);
  std::atomic<int> cancelled(0);
  auto functor = [&fired, &cancelled](lf::detail::deadline_timer const&, bool ok) { ++(ok ? fired : cancelled); };

  using namespace std::chrono_literals;
  auto poll = queue.make_relative_timer(200ms, "poll-interval", functor);
  queue.cancel_timer(poll);
  queue.make_relative_timer(5ms, "watch-timeout", functor);
  EXPECT_EQ(queue.pending_timers(), 2UL);
  std::thread t([&queue]() { queue.run(); });

  EXPECT_TRUE(eventually([&]() { return fired.load() == 1 and cancelled.load() == 1; }));
  EXPECT_EQ(queue.pending_timers(), 0UL);

  queue.shutdown();
  t.join();
}

/**
 * @test Cancelling a null timer is a no-op.
 */
TEST(completion_queue, cancel_null) {
  lf::completion_queue<> queue;
  EXPECT_NO_THROW(queue.cancel_timer(std::shared_ptr<lf::detail::deadline_timer>()));
}

/**
 * @test Verify that unknown tags and failing callbacks do not stop the loop.
 */
TEST(completion_queue, errors_do_not_stop_the_loop) {
  using namespace std::chrono_literals;

  lf::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  grpc::CompletionQueue* cq = lf::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  queue.make_relative_timer(5ms, "raises", [](auto const&, bool) { throw std::runtime_error("refresh failed"); });
  queue.make_relative_timer(40ms, "after", [&cnt](auto const&, bool) { ++cnt; });
  // ... alarms posted around the API, with a nullptr tag and with a tag the queue does not know about ...
  grpc::Alarm al1(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  grpc::Alarm al2(cq, std::chrono::system_clock::now() + 20ms, (void*)&cnt);

  EXPECT_TRUE(eventually([&cnt]() { return cnt.load() == 1; }));

  queue.shutdown();
  t.join();
}

/**
 * @test Verify the interceptor sees every timer and cancellation.
 */
TEST(completion_queue, mocked) {
  using namespace ::testing;
  using namespace std::chrono_literals;
  lf::completion_queue<lf::detail::mocked_grpc_interceptor> queue;

  std::shared_ptr<lf::detail::deadline_timer> posted;
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_))
      .WillOnce(Invoke([&posted](std::shared_ptr<lf::detail::deadline_timer> t) { posted = t; }));
  EXPECT_CALL(*queue.interceptor().shared_mock, cancel_deadline_timer(_))
      .WillOnce(Invoke([](std::shared_ptr<lf::detail::deadline_timer> t) { t->callback(*t, false); }));

  int calls = 0;
  bool last_ok = true;
  auto timer = queue.make_relative_timer(1s, "watch-timeout", [&](auto const& t, bool ok) {
    ++calls;
    last_ok = ok;
    EXPECT_EQ(t.name, "watch-timeout");
  });
  EXPECT_EQ(posted, timer);
  queue.cancel_timer(timer);
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(last_ok);
}
