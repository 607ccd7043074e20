#ifndef lf_detail_exponential_backoff_hpp
#define lf_detail_exponential_backoff_hpp

#include <chrono>

namespace lf {
namespace detail {

/**
 * Compute the delays between connection attempts.
 *
 * The first failure waits @a initial, each further failure doubles the delay up to @a maximum.  After @a max_attempts
 * failures record_failure() raises lf::connection_error.
 */
class exponential_backoff {
public:
  exponential_backoff(std::chrono::milliseconds initial, std::chrono::milliseconds maximum, int max_attempts);

  /// Return how long to wait before the next attempt.
  std::chrono::milliseconds record_failure();

private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds maximum_;
  int max_attempts_;
  std::chrono::milliseconds next_;
  int attempts_;
};

} // namespace detail
} // namespace lf

#endif // lf_detail_exponential_backoff_hpp
