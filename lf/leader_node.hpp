#ifndef lf_leader_node_hpp
#define lf_leader_node_hpp

#include <cstdint>
#include <string>
#include <vector>

namespace lf {

/// The prefix of the ephemeral-sequential nodes created by each election member.
extern char const election_member_prefix[];

/**
 * Parse the sequence number of an election member node.
 *
 * @param child the name of a node in the election directory, e.g. "member_0000000002".
 * @param sequence set to the parsed sequence number if @a child is an election member.
 * @return false if @a child does not start with the election member prefix.
 * @throws lf::resolution_error if @a child has the prefix but the suffix is not a non-negative integer.
 */
bool parse_member_sequence(std::string const& child, std::uint64_t& sequence);

/**
 * Find the current leader in an election directory.
 *
 * The leader is the member with the smallest sequence number, i.e., the oldest surviving registration.  The sequence
 * numbers are compared as integers, they need not be zero-padded nor contiguous.  Nodes without the member prefix are
 * ignored.  If two members had the same sequence number the first one in @a children would win.
 *
 * @param election_path the election directory, e.g. "/aurora/scheduler".
 * @param children the names of the nodes in the election directory.
 * @return the full path of the leader node.
 * @throws lf::not_found_error if no child is an election member.
 * @throws lf::resolution_error if a member has a malformed sequence number.
 */
std::string select_leader_node(std::string const& election_path, std::vector<std::string> const& children);

} // namespace lf

#endif // lf_leader_node_hpp
