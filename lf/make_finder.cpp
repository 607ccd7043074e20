#include "lf/make_finder.hpp"
#include <lf/curl_http_client.hpp>
#include <lf/zookeeper_client.hpp>

namespace lf {

std::unique_ptr<finder> make_finder(std::string const& address, finder_config const& config) {
  return make_finder(address, config, &zookeeper_client::create, std::make_shared<curl_http_client>());
}

} // namespace lf
