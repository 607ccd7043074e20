#ifndef lf_detail_mocked_coordination_client_hpp
#define lf_detail_mocked_coordination_client_hpp

#include <lf/coordination_client.hpp>

#include <gmock/gmock.h>

namespace lf {
namespace detail {

/**
 * A gmock implementation of lf::coordination_client.
 *
 * Tests usually save the watch callback from get_data_and_watch() and invoke it later to simulate the node changing
 * or being deleted.
 */
class mocked_coordination_client : public coordination_client {
public:
  MOCK_METHOD1(get_children, std::vector<std::string>(std::string const&));
  MOCK_METHOD2(get_data_and_watch, std::string(std::string const&, watch_callback));
  MOCK_METHOD1(get_data, std::string(std::string const&));
};

} // namespace detail
} // namespace lf

#endif // lf_detail_mocked_coordination_client_hpp
