#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "dvroute/core/constants.hpp"
#include "dvroute/core/error.hpp"
#include "dvroute/core/routing_table.hpp"

using namespace dvroute::core;

namespace {
// Router 0 with links to 1 (cost 2) and 3 (cost 7) in a 4-node universe.
RoutingTable make_table() {
  std::vector<Neighbor> nbrs = {{1, 2.0}, {3, 7.0}};
  return RoutingTable(0, nbrs, 4);
}
} // namespace

TEST(RoutingTable, SeedsSelfNeighborsAndUnknowns) {
  auto t = make_table();
  EXPECT_EQ(t.size(), 4);
  EXPECT_EQ(t.entry(0), (RoutingEntry{0, 0.0, 0}));
  EXPECT_EQ(t.entry(1), (RoutingEntry{1, 2.0, 1}));
  EXPECT_EQ(t.entry(3), (RoutingEntry{3, 7.0, 3}));
  EXPECT_TRUE(std::isinf(t.entry(2).cost));
  EXPECT_EQ(t.entry(2).next_hop, kNoNode);
  EXPECT_THROW((void)t.entry(4), std::out_of_range);
}

TEST(RoutingTable, RejectsBadSeeds) {
  std::vector<Neighbor> self_link = {{0, 1.0}};
  EXPECT_THROW(RoutingTable(0, self_link, 2), ConfigurationError);
  std::vector<Neighbor> oob = {{5, 1.0}};
  EXPECT_THROW(RoutingTable(0, oob, 2), ConfigurationError);
  EXPECT_THROW(RoutingTable(2, {}, 2), ConfigurationError);
  std::vector<Neighbor> dup = {{1, 5.0}, {1, 2.0}};
  EXPECT_THROW(RoutingTable(0, dup, 2), ConfigurationError);
  for (double bad : {0.0, -3.0, std::numeric_limits<double>::quiet_NaN(), kInfCost}) {
    std::vector<Neighbor> nbrs = {{1, bad}};
    EXPECT_THROW(RoutingTable(0, nbrs, 2), ConfigurationError) << "cost " << bad;
  }
}

TEST(RoutingTable, RelaxAdoptsStrictImprovement) {
  auto t = make_table();
  // Router 1 advertises: 0 at 2, itself at 0, 2 at 1, 3 at 3
  DistanceVector adv = {2.0, 0.0, 1.0, 3.0};
  EXPECT_TRUE(t.relax(1, adv, 2.0));
  EXPECT_EQ(t.entry(2), (RoutingEntry{2, 3.0, 1}));
  EXPECT_EQ(t.entry(3), (RoutingEntry{3, 5.0, 1}));
  EXPECT_EQ(t.entry(1), (RoutingEntry{1, 2.0, 1}));
  // Same advertisement again changes nothing
  EXPECT_FALSE(t.relax(1, adv, 2.0));
}

TEST(RoutingTable, EqualCostKeepsCurrentNextHop) {
  std::vector<Neighbor> nbrs = {{1, 2.0}, {3, 3.0}};
  RoutingTable t(0, nbrs, 4);
  DistanceVector via1 = {2.0, 0.0, 4.0, kInfCost};
  ASSERT_TRUE(t.relax(1, via1, 2.0));
  EXPECT_EQ(t.entry(2), (RoutingEntry{2, 6.0, 1}));
  // 3 + 3 == 6: a tie must not move the route
  DistanceVector via3 = {3.0, kInfCost, 3.0, 0.0};
  EXPECT_FALSE(t.relax(3, via3, 3.0));
  EXPECT_EQ(t.entry(2), (RoutingEntry{2, 6.0, 1}));
}

TEST(RoutingTable, UnreachableAdvertisementStaysInfinite) {
  auto t = make_table();
  DistanceVector adv = {2.0, 0.0, kInfCost, kInfCost};
  EXPECT_FALSE(t.relax(1, adv, 2.0));
  EXPECT_TRUE(std::isinf(t.entry(2).cost));
  EXPECT_EQ(t.entry(2).next_hop, kNoNode);
  EXPECT_EQ(t.entry(3).cost, 7.0);
}

TEST(RoutingTable, SelfEntryNeverRelaxed) {
  auto t = make_table();
  DistanceVector adv = {-5.0, 0.0, kInfCost, kInfCost};
  EXPECT_FALSE(t.relax(1, adv, 2.0));
  EXPECT_EQ(t.entry(0), (RoutingEntry{0, 0.0, 0}));
}

TEST(RoutingTable, WrongVectorLengthRejected) {
  auto t = make_table();
  DistanceVector shorter = {2.0, 0.0};
  EXPECT_THROW(t.relax(1, shorter, 2.0), ConfigurationError);
  EXPECT_EQ(t.entry(1).cost, 2.0);
}

TEST(RoutingTable, SnapshotDoesNotAlias) {
  auto t = make_table();
  auto before = t.snapshot();
  DistanceVector adv = {2.0, 0.0, 1.0, 3.0};
  ASSERT_TRUE(t.relax(1, adv, 2.0));
  EXPECT_TRUE(std::isinf(before[2].cost));
  EXPECT_EQ(before[3].cost, 7.0);
  auto after = t.snapshot();
  EXPECT_EQ(after[3].cost, 5.0);
  for (std::size_t d = 0; d < after.size(); ++d) EXPECT_EQ(after[d].dst, static_cast<NodeId>(d));
}

TEST(RoutingTable, VectorCarriesCostsOnly) {
  auto t = make_table();
  auto v = t.as_vector();
  ASSERT_EQ(v.size(), 4u);
  EXPECT_EQ(v[0], 0.0);
  EXPECT_EQ(v[1], 2.0);
  EXPECT_TRUE(std::isinf(v[2]));
  EXPECT_EQ(v[3], 7.0);
}
