#ifndef lf_detail_mocked_http_client_hpp
#define lf_detail_mocked_http_client_hpp

#include <lf/http_client.hpp>

#include <gmock/gmock.h>

namespace lf {
namespace detail {

/// A gmock implementation of lf::http_client.
class mocked_http_client : public http_client {
public:
  MOCK_METHOD2(get, http_response(std::string const&, std::chrono::milliseconds));
};

} // namespace detail
} // namespace lf

#endif // lf_detail_mocked_http_client_hpp
