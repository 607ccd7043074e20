#ifndef lf_curl_http_client_hpp
#define lf_curl_http_client_hpp

#include <lf/http_client.hpp>

namespace lf {

/**
 * Implement lf::http_client with libcurl.
 *
 * Each request uses its own easy handle, so a single client can be shared by many threads.  The response body is
 * discarded.
 */
class curl_http_client : public http_client {
public:
  /// Initializes libcurl (once per process) if needed.
  curl_http_client();

  http_response get(std::string const& url, std::chrono::milliseconds timeout) override;
};

} // namespace lf

#endif // lf_curl_http_client_hpp
