#include "lf/http_client.hpp"

#include <algorithm>
#include <cctype>

namespace lf {

std::string http_response::header(std::string const& name) const {
  auto same_name = [&name](std::pair<std::string, std::string> const& h) {
    return h.first.size() == name.size() and
           std::equal(h.first.begin(), h.first.end(), name.begin(), [](char a, char b) {
             return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
  };
  auto f = std::find_if(headers.begin(), headers.end(), same_name);
  if (f == headers.end()) {
    return std::string();
  }
  return f->second;
}

} // namespace lf
