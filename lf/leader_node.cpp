#include "lf/leader_node.hpp"
#include <lf/errors.hpp>

#include <cctype>
#include <limits>

namespace lf {

char const election_member_prefix[] = "member_";

bool parse_member_sequence(std::string const& child, std::uint64_t& sequence) {
  auto const prefix_length = sizeof(election_member_prefix) - 1;
  if (child.compare(0, prefix_length, election_member_prefix) != 0) {
    return false;
  }
  if (child.size() == prefix_length) {
    throw resolution_error("election node <" + child + "> has no sequence number");
  }
  std::uint64_t value = 0;
  auto const max = std::numeric_limits<std::uint64_t>::max();
  for (auto i = child.begin() + prefix_length; i != child.end(); ++i) {
    if (not std::isdigit(static_cast<unsigned char>(*i))) {
      throw resolution_error("election node <" + child + "> has a non-numeric sequence number");
    }
    std::uint64_t digit = *i - '0';
    if (value > (max - digit) / 10) {
      throw resolution_error("election node <" + child + "> has an out of range sequence number");
    }
    value = 10 * value + digit;
  }
  sequence = value;
  return true;
}

std::string select_leader_node(std::string const& election_path, std::vector<std::string> const& children) {
  std::string const* leader = nullptr;
  std::uint64_t leader_sequence = 0;
  for (auto const& child : children) {
    std::uint64_t sequence;
    if (not parse_member_sequence(child, sequence)) {
      continue;
    }
    if (leader == nullptr or sequence < leader_sequence) {
      leader = &child;
      leader_sequence = sequence;
    }
  }
  if (leader == nullptr) {
    throw not_found_error("no leader node in <" + election_path + ">");
  }
  if (not election_path.empty() and election_path.back() == '/') {
    return election_path + *leader;
  }
  return election_path + "/" + *leader;
}

} // namespace lf
