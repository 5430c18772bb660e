#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "dvroute/core/constants.hpp"
#include "dvroute/core/error.hpp"
#include "dvroute/core/simulator.hpp"
#include "dvroute/core/topology_io.hpp"
#include "test_utils.hpp"

using namespace dvroute::core;
using namespace dvroute::core::test;

TEST(Simulator, TriangleScenario) {
  auto topo = make_triangle();
  auto res = run_simulation(topo);
  const NodeId A = 0, B = 1, C = 2;
  const auto& t = res.final_tables;

  EXPECT_EQ(entry_of(t, A, B), (RoutingEntry{B, 1.0, B}));
  EXPECT_EQ(entry_of(t, A, C), (RoutingEntry{C, 2.0, B}));
  EXPECT_EQ(entry_of(t, B, A), (RoutingEntry{A, 1.0, A}));
  EXPECT_EQ(entry_of(t, B, C), (RoutingEntry{C, 1.0, C}));
  EXPECT_EQ(entry_of(t, C, A), (RoutingEntry{A, 2.0, B}));
  EXPECT_EQ(entry_of(t, C, B), (RoutingEntry{B, 1.0, B}));
  EXPECT_LE(res.converged_round, 2);
  EXPECT_EQ(res.converged_round, 2);
  // Round 0 plus two exchange rounds
  ASSERT_EQ(res.snapshots.size(), 3u);
  EXPECT_EQ(res.snapshots.front().round, 0);
  EXPECT_EQ(res.snapshots.back().round, 2);
}

TEST(Simulator, RoundZeroHoldsSeededTables) {
  auto topo = make_triangle();
  auto res = run_simulation(topo);
  const auto& r0 = res.snapshots.front().tables;
  EXPECT_EQ(entry_of(r0, 0, 2), (RoutingEntry{2, 5.0, 2}));
  EXPECT_EQ(entry_of(r0, 2, 0), (RoutingEntry{0, 5.0, 0}));
  // After round 1 the detour through B is known
  const auto& r1 = res.snapshots[1].tables;
  EXPECT_EQ(entry_of(r1, 0, 2), (RoutingEntry{2, 2.0, 1}));
}

TEST(Simulator, RoundsUsePreviousRoundVectors) {
  // On a line, information travels one hop per round: after round k router 0
  // knows exactly the routers within k + 1 hops.
  auto topo = make_line_topology(5);
  auto res = run_simulation(topo);
  ASSERT_EQ(res.snapshots.size(), 5u);
  for (std::size_t k = 0; k < 4; ++k) {
    const auto& row0 = res.snapshots[k].tables[0];
    for (NodeId d = 0; d < 5; ++d) {
      if (static_cast<std::size_t>(d) <= k + 1) {
        EXPECT_EQ(row0[static_cast<std::size_t>(d)].cost, static_cast<Cost>(d)) << "round " << k;
      } else {
        EXPECT_TRUE(std::isinf(row0[static_cast<std::size_t>(d)].cost)) << "round " << k << " dst " << d;
      }
    }
  }
  EXPECT_EQ(res.converged_round, 4);
}

TEST(Simulator, MatchesFloydWarshall) {
  for (std::uint32_t seed = 1; seed <= 8; ++seed) {
    auto topo = make_random_connected(12, 10, seed);
    auto res = run_simulation(topo);
    expect_tables_match_reference(topo, res.final_tables);
    expect_next_hops_consistent(topo, res.final_tables);
    EXPECT_LE(res.converged_round, topo.num_nodes() - 1) << "seed " << seed;
  }
  for (auto topo : {make_ring_topology(7), make_grid_topology(4, 5), demo_topology()}) {
    auto res = run_simulation(topo);
    expect_tables_match_reference(topo, res.final_tables);
    expect_next_hops_consistent(topo, res.final_tables);
  }
}

TEST(Simulator, CostsNeverIncreaseAcrossRounds) {
  auto topo = make_random_connected(15, 20, 42);
  auto res = run_simulation(topo);
  for (std::size_t k = 1; k < res.snapshots.size(); ++k) {
    const auto& prev = res.snapshots[k - 1].tables;
    const auto& cur = res.snapshots[k].tables;
    for (std::size_t u = 0; u < cur.size(); ++u) {
      for (std::size_t d = 0; d < cur[u].size(); ++d) {
        EXPECT_LE(cur[u][d].cost, prev[u][d].cost) << "round " << k << " router " << u << " dst " << d;
        EXPECT_GE(cur[u][d].cost, 0.0);
      }
    }
  }
}

TEST(Simulator, ExtraRoundAtFixpointIsQuiet) {
  auto topo = demo_topology();
  Simulator sim(topo);
  auto res = sim.run();
  ASSERT_TRUE(sim.converged());
  EXPECT_EQ(sim.round(), res.converged_round);
  auto before = sim.tables();
  EXPECT_FALSE(sim.step());
  EXPECT_EQ(sim.tables(), before);
  EXPECT_EQ(sim.round(), res.converged_round + 1);
  // run() after convergence still reports the first quiet round
  auto again = sim.run();
  EXPECT_EQ(again.converged_round, res.converged_round);
}

TEST(Simulator, RunsAreDeterministic) {
  auto topo = make_random_connected(20, 30, 7);
  auto a = run_simulation(topo);
  auto b = run_simulation(topo);
  EXPECT_EQ(a.converged_round, b.converged_round);
  EXPECT_EQ(a.snapshots, b.snapshots);
  EXPECT_EQ(a.final_tables, b.final_tables);
}

TEST(Simulator, EqualCostTiesPreferFirstNeighbor) {
  // Square 0-1-3 and 0-2-3, all links cost 1: both routes to the opposite
  // corner cost 2; the lower-id neighbor is offered first and kept.
  std::vector<NodeId> src = {0, 0, 1, 2};
  std::vector<NodeId> dst = {1, 2, 3, 3};
  std::vector<Cost> cost = {1, 1, 1, 1};
  auto topo = Topology::from_arrays(4, src, dst, cost);
  auto res = run_simulation(topo);
  EXPECT_EQ(entry_of(res.final_tables, 0, 3), (RoutingEntry{3, 2.0, 1}));
  EXPECT_EQ(entry_of(res.final_tables, 3, 0), (RoutingEntry{0, 2.0, 1}));
  EXPECT_EQ(entry_of(res.final_tables, 1, 2), (RoutingEntry{2, 2.0, 0}));
  EXPECT_EQ(entry_of(res.final_tables, 2, 1), (RoutingEntry{1, 2.0, 0}));
}

TEST(Simulator, SingleNodeConvergesImmediately) {
  auto topo = Topology::from_arrays(1, {}, {}, {});
  auto res = run_simulation(topo);
  EXPECT_EQ(res.converged_round, 1);
  ASSERT_EQ(res.final_tables.size(), 1u);
  EXPECT_EQ(res.final_tables[0][0], (RoutingEntry{0, 0.0, 0}));
}

TEST(Simulator, RoundCapRaisesTopologyError) {
  auto topo = make_line_topology(5);
  SimulatorOptions opts;
  opts.max_rounds = 2;
  try {
    (void)run_simulation(topo, opts);
    FAIL() << "expected TopologyError";
  } catch (const TopologyError& e) {
    EXPECT_EQ(e.rounds_attempted(), 2);
    EXPECT_EQ(e.last_snapshot().round, 2);
    ASSERT_EQ(e.last_snapshot().tables.size(), 5u);
    EXPECT_EQ(e.last_snapshot().tables[0][3].cost, 3.0);
    EXPECT_TRUE(std::isinf(e.last_snapshot().tables[0][4].cost));
  }
}

TEST(Simulator, DefaultCapIsTightOnALine) {
  auto topo = make_line_topology(6);
  Simulator sim(topo);
  EXPECT_EQ(sim.max_rounds(), 5);
  auto res = sim.run();
  EXPECT_EQ(res.converged_round, 5);
}

TEST(Simulator, InvalidRoundCapRejected) {
  auto topo = make_triangle();
  SimulatorOptions opts;
  opts.max_rounds = 0;
  EXPECT_THROW({ Simulator sim(topo, opts); }, ConfigurationError);
}

TEST(Simulator, OnRoundSeesEverySnapshot) {
  auto topo = demo_topology();
  std::vector<std::int32_t> seen;
  SimulatorOptions opts;
  opts.on_round = [&seen](const RoundSnapshot& s) { seen.push_back(s.round); };
  auto res = run_simulation(topo, opts);
  ASSERT_EQ(seen.size(), res.snapshots.size());
  for (std::size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i], static_cast<std::int32_t>(i));
}

TEST(Simulator, RecordSnapshotsOffKeepsLastOnly) {
  auto topo = demo_topology();
  SimulatorOptions opts;
  opts.record_snapshots = false;
  auto res = run_simulation(topo, opts);
  ASSERT_EQ(res.snapshots.size(), 1u);
  EXPECT_EQ(res.snapshots.back().round, res.converged_round);
  EXPECT_EQ(res.snapshots.back().tables, res.final_tables);
}

TEST(Simulator, DemoTopologyFinalRoutes) {
  auto topo = demo_topology();
  auto res = run_simulation(topo);
  auto id = [&topo](const char* label) { return *topo.find(label); };
  const auto& t = res.final_tables;
  EXPECT_EQ(entry_of(t, id("A"), id("D")), (RoutingEntry{id("D"), 5.0, id("B")}));
  EXPECT_EQ(entry_of(t, id("B"), id("D")), (RoutingEntry{id("D"), 4.0, id("F")}));
  EXPECT_EQ(entry_of(t, id("C"), id("F")), (RoutingEntry{id("F"), 4.0, id("B")}));
  EXPECT_EQ(entry_of(t, id("D"), id("A")), (RoutingEntry{id("A"), 5.0, id("E")}));
  EXPECT_EQ(entry_of(t, id("E"), id("C")), (RoutingEntry{id("C"), 3.0, id("D")}));
  EXPECT_EQ(entry_of(t, id("F"), id("D")), (RoutingEntry{id("D"), 3.0, id("E")}));
}
