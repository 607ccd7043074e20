#include "lf/address.hpp"
#include <lf/errors.hpp>

#include <cctype>
#include <sstream>

namespace {
char const zk_scheme[] = "zk://";
char const http_scheme[] = "http://";
char const https_scheme[] = "https://";

bool starts_with(std::string const& s, char const* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

[[noreturn]] void bad_member(std::string const& address, std::string const& member, char const* why) {
  std::ostringstream os;
  os << "bad address <" << address << ">: ensemble member <" << member << "> " << why;
  throw lf::configuration_error(os.str());
}

/// Validate a host:port pair, accepting [v6-address]:port.
std::string parse_member(std::string const& address, std::string member) {
  if (starts_with(member, zk_scheme)) {
    member.erase(0, sizeof(zk_scheme) - 1);
  }
  std::string::size_type colon;
  if (not member.empty() and member[0] == '[') {
    auto close = member.find(']');
    if (close == std::string::npos or close == 1) {
      bad_member(address, member, "has a malformed IPv6 host");
    }
    colon = close + 1;
    if (colon >= member.size() or member[colon] != ':') {
      bad_member(address, member, "is not a host:port pair");
    }
  } else {
    colon = member.rfind(':');
    if (colon == std::string::npos) {
      bad_member(address, member, "is not a host:port pair");
    }
    if (colon == 0) {
      bad_member(address, member, "has an empty host");
    }
  }
  auto port = member.substr(colon + 1);
  if (port.empty() or port.size() > 5) {
    bad_member(address, member, "has an invalid port");
  }
  for (char c : port) {
    if (not std::isdigit(static_cast<unsigned char>(c))) {
      bad_member(address, member, "has a non-numeric port");
    }
  }
  auto number = std::stoi(port);
  if (number <= 0 or number > 65535) {
    bad_member(address, member, "has a port out of range");
  }
  return member;
}

lf::finder_address parse_coordination(std::string const& address) {
  lf::finder_address r;
  r.mode = lf::discovery_mode::coordination;

  auto hosts = address.substr(sizeof(zk_scheme) - 1);
  // ... the election path starts at the first '/' that is not part of a repeated zk:// scheme ...
  std::string::size_type start = 0;
  std::string::size_type slash = std::string::npos;
  while (start < hosts.size()) {
    if (hosts.compare(start, sizeof(zk_scheme) - 1, zk_scheme) == 0) {
      start += sizeof(zk_scheme) - 1;
      continue;
    }
    if (hosts[start] == '/') {
      slash = start;
      break;
    }
    ++start;
  }
  if (slash != std::string::npos) {
    r.election_path = hosts.substr(slash);
    hosts.erase(slash);
    while (r.election_path.size() > 1 and r.election_path.back() == '/') {
      r.election_path.pop_back();
    }
    if (r.election_path == "/") {
      r.election_path.clear();
    }
  }
  if (hosts.empty()) {
    throw lf::configuration_error("bad address <" + address + ">: empty ensemble");
  }

  std::string::size_type begin = 0;
  while (begin <= hosts.size()) {
    auto end = hosts.find(',', begin);
    if (end == std::string::npos) {
      end = hosts.size();
    }
    auto member = hosts.substr(begin, end - begin);
    if (member.empty()) {
      throw lf::configuration_error("bad address <" + address + ">: empty ensemble member");
    }
    r.ensemble.push_back(parse_member(address, std::move(member)));
    begin = end + 1;
  }
  return r;
}

lf::finder_address parse_probe(std::string const& address, std::size_t scheme_length) {
  lf::finder_address r;
  r.mode = lf::discovery_mode::http_probe;
  r.base_url = address;
  while (r.base_url.size() > scheme_length and r.base_url.back() == '/') {
    r.base_url.pop_back();
  }
  if (r.base_url.size() == scheme_length) {
    throw lf::configuration_error("bad address <" + address + ">: empty host");
  }
  return r;
}
} // anonymous namespace

namespace lf {

finder_address parse_address(std::string const& address) {
  if (starts_with(address, http_scheme)) {
    return parse_probe(address, sizeof(http_scheme) - 1);
  }
  if (starts_with(address, https_scheme)) {
    return parse_probe(address, sizeof(https_scheme) - 1);
  }
  if (starts_with(address, zk_scheme)) {
    return parse_coordination(address);
  }
  throw configuration_error("bad address <" + address + ">");
}

std::string ensemble_connect_string(std::vector<std::string> const& ensemble) {
  std::string r;
  char const* sep = "";
  for (auto const& member : ensemble) {
    r += sep;
    r += member;
    sep = ",";
  }
  return r;
}

} // namespace lf
