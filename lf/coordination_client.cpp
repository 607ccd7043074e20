#include "lf/coordination_client.hpp"

#include <lf/log.hpp>

#include <iostream>

namespace lf {

std::ostream& operator<<(std::ostream& os, watch_event_type x) {
  char const* names[] = {"data_changed", "node_deleted", "watch_error", "channel_closed"};
  return os << names[int(x)];
}

std::ostream& operator<<(std::ostream& os, session_state x) {
  char const* names[] = {"connecting", "connected", "expired", "auth_failed", "closed"};
  return os << names[int(x)];
}

void log_session_event(session_event const& ev) {
  if (ev.state == session_state::connected) {
    LF_LOG(info) << "coordination session connected to " << ev.server;
  } else {
    LF_LOG(warning) << "coordination session state changed to " << ev.state;
  }
}

} // namespace lf
