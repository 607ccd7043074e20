#include "lf/log_severity.hpp"
#include <lf/errors.hpp>

#include <iostream>

namespace {
char const* const names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace lf {

std::ostream& operator<<(std::ostream& os, severity x) {
  return os << names[int(x)];
}

severity parse_severity(std::string const& name) {
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (name == names[i]) {
      return severity(i);
    }
  }
  throw configuration_error("unknown log severity <" + name + ">");
}

} // namespace lf
