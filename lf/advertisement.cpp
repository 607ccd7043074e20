#include "lf/advertisement.hpp"
#include <lf/errors.hpp>
#include <lf/service_instance.pb.h>

#include <google/protobuf/util/json_util.h>

#include <sstream>

namespace lf {

char const invalid_advertisement[] = "\x01";

leader_advertisement decode_advertisement(std::string const& payload) {
  if (payload == invalid_advertisement) {
    throw decode_error("received the SOH placeholder instead of an advertisement");
  }
  if (payload.empty()) {
    throw decode_error("received an empty advertisement");
  }

  lfpb::ServiceInstance instance;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(payload, &instance, options);
  if (not status.ok()) {
    throw decode_error("cannot parse advertisement: " + status.ToString());
  }

  auto const& endpoint = instance.service_endpoint();
  if (endpoint.host().empty()) {
    throw decode_error("advertisement has no service endpoint host");
  }
  if (endpoint.port() <= 0 or endpoint.port() > 65535) {
    std::ostringstream os;
    os << "advertisement has an invalid service endpoint port (" << endpoint.port() << ")";
    throw decode_error(os.str());
  }

  leader_advertisement r;
  r.host = endpoint.host();
  r.port = endpoint.port();
  r.status = instance.status();
  return r;
}

} // namespace lf
