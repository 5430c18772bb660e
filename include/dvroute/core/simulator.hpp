/* Synchronous distance-vector simulation (distributed Bellman-Ford). */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "dvroute/core/router.hpp"
#include "dvroute/core/topology.hpp"
#include "dvroute/core/types.hpp"

namespace dvroute::core {

struct SimulatorOptions {
  // Round cap; defaults to max(num_nodes - 1, 1), the hop bound of a
  // shortest path plus the quiet round that confirms it.
  std::optional<std::int32_t> max_rounds {};
  // If false, only the most recent snapshot is retained.
  bool record_snapshots { true };
  // Invoked with every recorded snapshot, round 0 included.
  std::function<void(const RoundSnapshot&)> on_round {};
};

struct SimulationResult {
  std::vector<RoundSnapshot> snapshots;   // round 0..converged_round (or only the last)
  std::int32_t converged_round {0};       // first round with no table change
  std::vector<TableSnapshot> final_tables;
};

// Drives rounds over one Router per Topology node. Each round captures every
// router's vector before any relaxation, so a round only ever sees the
// previous round's state and the result does not depend on visiting order.
class Simulator {
public:
  explicit Simulator(const Topology& topo, SimulatorOptions opts = {});

  // Runs one round and records its snapshot. Returns true if any table changed.
  // Valid after convergence as well (a quiet round returns false).
  bool step();

  // Steps until a quiet round. Throws TopologyError once max_rounds rounds
  // have run without one.
  SimulationResult run();

  [[nodiscard]] std::int32_t round() const noexcept { return round_; }
  [[nodiscard]] bool converged() const noexcept { return converged_; }
  [[nodiscard]] std::int32_t max_rounds() const noexcept { return max_rounds_; }
  [[nodiscard]] const std::vector<Router>& routers() const noexcept { return routers_; }
  [[nodiscard]] const std::vector<RoundSnapshot>& snapshots() const noexcept { return snapshots_; }
  [[nodiscard]] std::vector<TableSnapshot> tables() const;

private:
  void record();

  SimulatorOptions opts_;
  std::int32_t max_rounds_ {1};
  std::int32_t round_ {0};
  bool converged_ {false};
  std::int32_t converged_round_ {0};
  std::vector<Router> routers_;
  std::vector<RoundSnapshot> snapshots_;
};

// Function-call boundary: build, run to convergence, return all snapshots.
[[nodiscard]] SimulationResult run_simulation(const Topology& topo, const SimulatorOptions& opts = {});

} // namespace dvroute::core
