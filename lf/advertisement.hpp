#ifndef lf_advertisement_hpp
#define lf_advertisement_hpp

#include <string>

namespace lf {

/// The sentinel payload found in election nodes that do not (yet) hold an advertisement.
extern char const invalid_advertisement[];

/**
 * The decoded advertisement of an election member.
 *
 * Only the primary service endpoint and the status are used; additional endpoints are accepted and ignored.
 */
struct leader_advertisement {
  std::string host;
  int port = 0;
  std::string status;
};

/**
 * Decode the payload stored in an election node.
 *
 * The payload is a JSON object, unknown fields are ignored.  The sentinel payload (a single SOH control character) is
 * rejected before any parsing is attempted.
 *
 * @throws lf::decode_error if the payload is the sentinel, is not valid JSON for the advertisement, or lacks a usable
 * service endpoint.
 */
leader_advertisement decode_advertisement(std::string const& payload);

} // namespace lf

#endif // lf_advertisement_hpp
