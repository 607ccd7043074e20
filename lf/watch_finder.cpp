#include "lf/watch_finder.hpp"
#include <lf/assert_throw.hpp>
#include <lf/detail/coordination_watcher.hpp>

namespace lf {
watch_finder::watch_finder(
    std::shared_ptr<active_completion_queue> queue, std::shared_ptr<coordination_client> client,
    std::string election_path, finder_config const& config)
    : queue_(std::move(queue))
    , client_(std::move(client))
    , watcher_(std::make_shared<detail::coordination_watcher<completion_queue<>>>(
          std::move(election_path), config, queue_->cq(), client_)) {
  watcher_->startup();
}

watch_finder::~watch_finder() noexcept(false) {
  shutdown();
}

std::string watch_finder::leader_url() {
  return watcher_->leader_url();
}

std::string const& watch_finder::election_path() const {
  return watcher_->election_path();
}

bool watch_finder::has_leader() const {
  return watcher_->has_leader();
}

long watch_finder::subscribe(subscriber_type&& subscriber) {
  return watcher_->subscribe(std::move(subscriber));
}

void watch_finder::unsubscribe(long token) {
  watcher_->unsubscribe(token);
}

void watch_finder::shutdown() {
  LF_ASSERT_THROW(not queue_->in_loop_thread());
  watcher_->shutdown();
}
} // namespace lf
