#ifndef lf_http_client_hpp
#define lf_http_client_hpp

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace lf {

/// The parts of an HTTP response the probe finder looks at.
struct http_response {
  long status = 0;
  /// The response headers in the order received, names as sent by the server.
  std::vector<std::pair<std::string, std::string>> headers;

  /// Return the value of the first header called @a name (case insensitive), or an empty string.
  std::string header(std::string const& name) const;
};

/**
 * Issue HTTP requests for the probe finder.
 *
 * Implementations must not follow redirects, the probe finder needs the Location header of the redirect itself.
 */
class http_client {
public:
  virtual ~http_client() = default;

  /**
   * GET @a url, waiting at most @a timeout for the complete response.
   *
   * @throws lf::resolution_error if the request cannot be completed.
   */
  virtual http_response get(std::string const& url, std::chrono::milliseconds timeout) = 0;
};

} // namespace lf

#endif // lf_http_client_hpp
