#include "lf/zookeeper_client.hpp"
#include <lf/address.hpp>
#include <lf/detail/exponential_backoff.hpp>
#include <lf/errors.hpp>
#include <lf/log.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>
#include <vector>

namespace {
std::once_flag zookeeper_log_level;

lf::session_state to_session_state(int state) {
  if (state == ZOO_CONNECTED_STATE) {
    return lf::session_state::connected;
  }
  if (state == ZOO_CONNECTING_STATE or state == ZOO_ASSOCIATING_STATE) {
    return lf::session_state::connecting;
  }
  if (state == ZOO_EXPIRED_SESSION_STATE) {
    return lf::session_state::expired;
  }
  if (state == ZOO_AUTH_FAILED_STATE) {
    return lf::session_state::auth_failed;
  }
  return lf::session_state::closed;
}

/**
 * Translate a node event, return false if the watch stays registered.
 *
 * The C client delivers every session event to all the node watchers, only the events that end the session also end
 * the watch.
 */
bool to_watch_event(int type, int state, char const* path, lf::watch_event& ev) {
  ev.path = path == nullptr ? "" : path;
  if (type == ZOO_CHANGED_EVENT or type == ZOO_CREATED_EVENT or type == ZOO_CHILD_EVENT) {
    ev.type = lf::watch_event_type::data_changed;
    return true;
  }
  if (type == ZOO_DELETED_EVENT) {
    ev.type = lf::watch_event_type::node_deleted;
    return true;
  }
  if (type == ZOO_NOTWATCHING_EVENT) {
    ev.type = lf::watch_event_type::watch_error;
    ev.detail = "watch removed by the server";
    return true;
  }
  auto s = to_session_state(state);
  if (s == lf::session_state::connected or s == lf::session_state::connecting) {
    return false;
  }
  std::ostringstream os;
  os << "session " << s;
  ev.type = lf::watch_event_type::channel_closed;
  ev.detail = os.str();
  return true;
}

/// Release the memory allocated by zoo_get_children().
struct string_vector_guard {
  ~string_vector_guard() {
    deallocate_String_vector(&strings);
  }
  String_vector strings;
};
} // anonymous namespace

namespace lf {

zookeeper_client::zookeeper_client(std::string connect_string, finder_config const& config, session_callback on_session)
    : connect_string_(std::move(connect_string))
    , config_(config)
    , on_session_(std::move(on_session))
    , handle_mu_()
    , zh_(nullptr)
    , mu_()
    , cv_()
    , state_(session_state::closed)
    , watches_() {
  std::call_once(zookeeper_log_level, []() { zoo_set_debug_level(ZOO_LOG_LEVEL_ERROR); });
  std::lock_guard<std::mutex> lock(handle_mu_);
  connect();
}

zookeeper_client::~zookeeper_client() {
  std::lock_guard<std::mutex> lock(handle_mu_);
  close();
}

std::shared_ptr<coordination_client> zookeeper_client::create(
    std::vector<std::string> const& ensemble, finder_config const& config, session_callback on_session) {
  return std::make_shared<zookeeper_client>(ensemble_connect_string(ensemble), config, std::move(on_session));
}

std::vector<std::string> zookeeper_client::get_children(std::string const& path) {
  std::lock_guard<std::mutex> lock(handle_mu_);
  ensure_session();
  string_vector_guard children;
  children.strings.count = 0;
  children.strings.data = nullptr;
  int rc = zoo_get_children(zh_, path.c_str(), 0, &children.strings);
  if (rc != ZOK) {
    throw resolution_error("cannot list " + path + " on " + connect_string_ + ": " + zerror(rc));
  }
  return std::vector<std::string>(children.strings.data, children.strings.data + children.strings.count);
}

std::string zookeeper_client::get_data_and_watch(std::string const& path, watch_callback on_change) {
  std::lock_guard<std::mutex> lock(handle_mu_);
  ensure_session();

  std::unique_ptr<pending_watch> watch(new pending_watch{this, std::move(on_change)});
  auto* context = watch.get();
  {
    std::lock_guard<std::mutex> state_lock(mu_);
    watches_.emplace(context, std::move(watch));
  }

  std::vector<char> buffer(max_node_size);
  int length = static_cast<int>(buffer.size());
  struct Stat stat;
  int rc = zoo_wget(zh_, path.c_str(), &zookeeper_client::on_node_event, context, buffer.data(), &length, &stat);
  if (rc != ZOK) {
    // ... the C client only registers the watch on success ...
    {
      std::lock_guard<std::mutex> state_lock(mu_);
      watches_.erase(context);
    }
    if (rc == ZNONODE) {
      throw watch_interrupted(path + " no longer exists");
    }
    throw resolution_error("cannot read " + path + " on " + connect_string_ + ": " + zerror(rc));
  }
  if (length < 0) {
    return std::string();
  }
  return std::string(buffer.data(), length);
}

std::string zookeeper_client::get_data(std::string const& path) {
  std::lock_guard<std::mutex> lock(handle_mu_);
  ensure_session();
  std::vector<char> buffer(max_node_size);
  int length = static_cast<int>(buffer.size());
  struct Stat stat;
  int rc = zoo_get(zh_, path.c_str(), 0, buffer.data(), &length, &stat);
  if (rc == ZNONODE) {
    throw watch_interrupted(path + " no longer exists");
  }
  if (rc != ZOK) {
    throw resolution_error("cannot read " + path + " on " + connect_string_ + ": " + zerror(rc));
  }
  if (length < 0) {
    return std::string();
  }
  return std::string(buffer.data(), length);
}

session_state zookeeper_client::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void zookeeper_client::connect() {
  detail::exponential_backoff backoff(
      std::chrono::milliseconds(100), std::chrono::seconds(5), config_.connect_max_attempts);
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = session_state::connecting;
  }
  while (true) {
    zh_ = zookeeper_init(
        connect_string_.c_str(), &zookeeper_client::on_session_event, static_cast<int>(config_.session_timeout.count()),
        nullptr, this, 0);
    if (zh_ != nullptr) {
      break;
    }
    int error = errno;
    // ... zookeeper_init() reports name resolution failures as EINVAL or ENOENT, those may be transient ...
    if (error != EINVAL and error != ENOENT) {
      throw connection_error("zookeeper_init(" + connect_string_ + ") failed: " + std::strerror(error));
    }
    auto delay = backoff.record_failure();
    LF_LOG(warning) << "zookeeper_init(" << connect_string_ << ") failed: " << std::strerror(error) << ", retrying in "
                    << delay.count() << "ms";
    std::this_thread::sleep_for(delay);
  }

  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, config_.connect_timeout, [this]() { return state_ != session_state::connecting; });
  auto state = state_;
  lock.unlock();
  if (state == session_state::connected) {
    return;
  }
  close();
  std::ostringstream os;
  if (state == session_state::connecting) {
    os << "cannot connect to " << connect_string_ << " within " << config_.connect_timeout.count() << "ms";
  } else {
    os << "cannot connect to " << connect_string_ << ", session " << state;
  }
  throw connection_error(os.str());
}

void zookeeper_client::close() {
  if (zh_ == nullptr) {
    return;
  }
  int rc = zookeeper_close(zh_);
  zh_ = nullptr;
  if (rc != ZOK) {
    LF_LOG(warning) << "zookeeper_close(" << connect_string_ << ") failed: " << zerror(rc);
  }
  std::unordered_map<pending_watch*, std::unique_ptr<pending_watch>> orphans;
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = session_state::closed;
    orphans.swap(watches_);
  }
  // ... the watches died with the handle, their owners must register new ones ...
  for (auto& w : orphans) {
    try {
      w.second->callback(watch_event{watch_event_type::channel_closed, "", "session closed"});
    } catch (std::exception const& ex) {
      LF_LOG(error) << "watch callback raised while closing " << connect_string_ << ": " << ex.what();
    }
  }
}

void zookeeper_client::ensure_session() {
  auto s = state();
  if (zh_ != nullptr and s != session_state::expired and s != session_state::auth_failed) {
    return;
  }
  LF_LOG(warning) << "session to " << connect_string_ << " is " << s << ", reconnecting";
  close();
  try {
    connect();
  } catch (connection_error const& ex) {
    throw resolution_error(ex.what());
  }
}

void zookeeper_client::on_session_event(zhandle_t*, int type, int state, char const*, void* context) {
  if (type != ZOO_SESSION_EVENT) {
    return;
  }
  auto* self = static_cast<zookeeper_client*>(context);
  session_event ev{to_session_state(state), self->connect_string_};
  {
    std::lock_guard<std::mutex> lock(self->mu_);
    self->state_ = ev.state;
  }
  self->cv_.notify_all();
  if (not self->on_session_) {
    return;
  }
  try {
    self->on_session_(ev);
  } catch (std::exception const& ex) {
    LF_LOG(error) << "session callback raised: " << ex.what();
  }
}

void zookeeper_client::on_node_event(zhandle_t*, int type, int state, char const* path, void* context) {
  auto* watch = static_cast<pending_watch*>(context);
  watch_event ev;
  if (not to_watch_event(type, state, path, ev)) {
    return;
  }
  auto* self = watch->client;
  std::unique_ptr<pending_watch> owned;
  {
    std::lock_guard<std::mutex> lock(self->mu_);
    auto f = self->watches_.find(watch);
    if (f == self->watches_.end()) {
      return;
    }
    owned = std::move(f->second);
    self->watches_.erase(f);
  }
  try {
    owned->callback(ev);
  } catch (std::exception const& ex) {
    LF_LOG(error) << "watch callback for " << ev.path << " raised: " << ex.what();
  }
}

} // namespace lf
