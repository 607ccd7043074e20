#ifndef lf_make_finder_hpp
#define lf_make_finder_hpp

#include <lf/finder.hpp>

namespace lf {

/**
 * Create a finder for @a address using the default transports.
 *
 * "zk://" addresses connect with lf::zookeeper_client, "http://" and "https://" addresses probe with
 * lf::curl_http_client.
 *
 * @throws lf::configuration_error if the address or the configuration are invalid.
 * @throws lf::connection_error if the ensemble cannot be reached.
 */
std::unique_ptr<finder> make_finder(std::string const& address, finder_config const& config = finder_config());

} // namespace lf

#endif // lf_make_finder_hpp
