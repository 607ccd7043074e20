#ifndef lf_errors_hpp
#define lf_errors_hpp
/**
 * @file
 *
 * Define the exceptions raised by the leader finder library.
 */

#include <stdexcept>
#include <string>

namespace lf {

/// Base class for all the errors reported by the finders.
class finder_error : public std::runtime_error {
public:
  explicit finder_error(std::string const& what)
      : std::runtime_error(what) {
  }
};

/// The address or the configuration is malformed, constructing a finder cannot succeed.
class configuration_error : public finder_error {
public:
  explicit configuration_error(std::string const& what)
      : finder_error(what) {
  }
};

/// The coordination service could not be reached while constructing a finder.  The caller may try again.
class connection_error : public finder_error {
public:
  explicit connection_error(std::string const& what)
      : finder_error(what) {
  }
};

/**
 * The leader could not be determined.
 *
 * Returned per query (no leader known yet, stale information, probe failed) and per refresh cycle (listing or
 * reading the election directory failed).  Never fatal, callers decide whether to retry.
 */
class resolution_error : public finder_error {
public:
  explicit resolution_error(std::string const& what)
      : finder_error(what) {
  }
};

/// The election directory does not contain any member node.
class not_found_error : public resolution_error {
public:
  explicit not_found_error(std::string const& what)
      : resolution_error(what) {
  }
};

/// The leader advertisement is malformed, or is the known-invalid placeholder.
class decode_error : public finder_error {
public:
  explicit decode_error(std::string const& what)
      : finder_error(what) {
  }
};

/**
 * The one-shot watch on the leader node ended.
 *
 * The node changed, was deleted, or the watch failed.  This is the normal signal to re-resolve the leader, it is
 * never reported to the callers of lf::finder::leader_url().
 */
class watch_interrupted : public finder_error {
public:
  explicit watch_interrupted(std::string const& what)
      : finder_error(what) {
  }
};

/// An internal invariant was violated, see LF_ASSERT_THROW().
class internal_error : public std::logic_error {
public:
  explicit internal_error(std::string const& what)
      : std::logic_error(what) {
  }
};

} // namespace lf

#endif // lf_errors_hpp
