#include "lf/leader_node.hpp"
#include <lf/errors.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace {
std::string member(std::uint64_t sequence, int width = 10) {
  std::ostringstream os;
  os << lf::election_member_prefix << std::setw(width) << std::setfill('0') << sequence;
  return os.str();
}
} // anonymous namespace

/**
 * @test The oldest member wins, regardless of the listing order.
 */
TEST(leader_node, lowest_sequence_wins) {
  std::vector<std::string> children{"member_0000000005", "member_0000000002", "member_0000000009"};
  EXPECT_EQ(lf::select_leader_node("/aurora/scheduler", children), "/aurora/scheduler/member_0000000002");
}

/**
 * @test Sequence numbers are compared as integers, not as strings.
 */
TEST(leader_node, numeric_comparison) {
  std::vector<std::string> children{"member_10", "member_9", "member_0000000011"};
  EXPECT_EQ(lf::select_leader_node("/election", children), "/election/member_9");

  children = {"member_100", "member_020"};
  EXPECT_EQ(lf::select_leader_node("/election", children), "/election/member_020");
}

/**
 * @test Nodes that are not election members are ignored.
 */
TEST(leader_node, ignore_unrelated_nodes) {
  std::vector<std::string> children{"lock", "member_0000000007", "config_0000000001", "xmember_0000000001"};
  EXPECT_EQ(lf::select_leader_node("/election/", children), "/election/member_0000000007");
}

/**
 * @test No members is a not found error.
 */
TEST(leader_node, no_members) {
  EXPECT_THROW(lf::select_leader_node("/election", {}), lf::not_found_error);
  EXPECT_THROW(lf::select_leader_node("/election", {"lock", "config"}), lf::not_found_error);
}

/**
 * @test A member with a bad sequence number fails the whole selection.
 */
TEST(leader_node, malformed_sequence) {
  EXPECT_THROW(lf::select_leader_node("/e", {"member_0000000001", "member_abc"}), lf::resolution_error);
  EXPECT_THROW(lf::select_leader_node("/e", {"member_"}), lf::resolution_error);
  EXPECT_THROW(lf::select_leader_node("/e", {"member_-1"}), lf::resolution_error);
  EXPECT_THROW(lf::select_leader_node("/e", {"member_12a"}), lf::resolution_error);
  EXPECT_THROW(lf::select_leader_node("/e", {"member_99999999999999999999999"}), lf::resolution_error);

  try {
    lf::select_leader_node("/e", {"member_abc"});
    FAIL() << "select_leader_node() should have raised";
  } catch (lf::not_found_error const&) {
    FAIL() << "a malformed member is not a missing leader";
  } catch (lf::resolution_error const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("member_abc"));
  }
}

/**
 * @test Duplicated sequence numbers resolve to the first one listed.
 */
TEST(leader_node, ties_pick_first) {
  std::vector<std::string> children{"member_7", "member_0000000007", "member_8"};
  EXPECT_EQ(lf::select_leader_node("/e", children), "/e/member_7");
}

/**
 * @test parse_member_sequence() handles the full range.
 */
TEST(leader_node, parse_member_sequence) {
  std::uint64_t sequence = 42;
  EXPECT_FALSE(lf::parse_member_sequence("lock", sequence));
  EXPECT_EQ(sequence, 42U);
  EXPECT_TRUE(lf::parse_member_sequence("member_0", sequence));
  EXPECT_EQ(sequence, 0U);
  EXPECT_TRUE(lf::parse_member_sequence("member_18446744073709551615", sequence));
  EXPECT_EQ(sequence, 18446744073709551615ULL);
  EXPECT_THROW(lf::parse_member_sequence("member_18446744073709551616", sequence), lf::resolution_error);
}

/**
 * @test For random sparse sets of members the minimum always wins.
 */
TEST(leader_node, random_sparse_sequences) {
  std::mt19937_64 generator(20261019);
  std::uniform_int_distribution<std::uint64_t> sequences(0, 5000000000ULL);
  std::uniform_int_distribution<int> sizes(1, 40);
  std::uniform_int_distribution<int> widths(1, 12);
  for (int trial = 0; trial != 200; ++trial) {
    std::vector<std::uint64_t> values(sizes(generator));
    std::generate(values.begin(), values.end(), [&]() { return sequences(generator); });
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    std::shuffle(values.begin(), values.end(), generator);

    std::vector<std::string> children;
    for (auto v : values) {
      children.push_back(member(v, widths(generator)));
    }
    children.push_back("unrelated");

    auto expected = *std::min_element(values.begin(), values.end());
    auto actual = lf::select_leader_node("/e", children);
    std::uint64_t sequence;
    ASSERT_TRUE(lf::parse_member_sequence(actual.substr(3), sequence)) << actual;
    EXPECT_EQ(sequence, expected) << "trial=" << trial;
  }
}
