#ifndef lf_http_probe_finder_hpp
#define lf_http_probe_finder_hpp

#include <lf/finder.hpp>
#include <lf/http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace lf {

/// The endpoint probed on the service, it redirects to the same endpoint on the leader.
extern char const scheduler_path[];

/**
 * Find the leader by following (one step of) the redirect sent by any service replica.
 *
 * Each query issues one GET to <base_url>/scheduler without following redirects.  The Location header points to the
 * leader's scheduler endpoint, the finder strips the endpoint to get the leader's base URL.  The finder keeps no state
 * between queries.
 */
class http_probe_finder : public finder {
public:
  http_probe_finder(std::string base_url, std::shared_ptr<http_client> client, std::chrono::milliseconds timeout);

  std::string leader_url() override;

  std::string const& base_url() const {
    return base_url_;
  }

private:
  std::string base_url_;
  std::shared_ptr<http_client> client_;
  std::chrono::milliseconds timeout_;
};

} // namespace lf

#endif // lf_http_probe_finder_hpp
