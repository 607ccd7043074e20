#include "lf/assert_throw.hpp"
#include <lf/errors.hpp>
#include <lf/log.hpp>

#include <sstream>

namespace lf {

void raise_assertion_failure(char const* expression, char const* file, int line) {
  std::ostringstream os;
  os << "internal error, (" << expression << ") is false at " << file << ":" << line;
  LF_LOG(critical) << os.str();
  throw internal_error(os.str());
}

} // namespace lf
