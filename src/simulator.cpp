/*
  Simulator — synchronous distributed Bellman-Ford.

  Round r:
    1. every router's vector is captured (state at the end of round r-1);
    2. each router v, in ascending id, relaxes against the captured vector of
       each neighbor u, in ascending id;
    3. a snapshot of every table is recorded.
  The first round in which no table changes is the convergence round. With
  positive costs this happens by round N-1; the round cap turns anything else
  into a TopologyError carrying the last snapshot.
*/
#include "dvroute/core/simulator.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "dvroute/core/error.hpp"
#include "dvroute/core/log.hpp"

namespace dvroute::core {

Simulator::Simulator(const Topology& topo, SimulatorOptions opts)
  : opts_(std::move(opts)) {
  const auto n = topo.num_nodes();
  if (opts_.max_rounds && *opts_.max_rounds <= 0) {
    throw ConfigurationError("max_rounds must be >= 1");
  }
  max_rounds_ = opts_.max_rounds.value_or(std::max<std::int32_t>(n - 1, 1));

  routers_.reserve(static_cast<std::size_t>(n));
  for (NodeId u = 0; u < n; ++u) {
    routers_.emplace_back(u, topo.neighbors(u), n);
  }
  logger()->debug("simulator: {} routers, {} links, round cap {}", n, topo.num_links(), max_rounds_);
  record();
}

bool Simulator::step() {
  // Snapshot-before-mutate: all relaxations this round read these copies.
  std::vector<DistanceVector> vectors;
  vectors.reserve(routers_.size());
  for (const auto& r : routers_) vectors.push_back(r.current_vector());

  std::int32_t changed_routers = 0;
  for (auto& r : routers_) {
    bool changed = false;
    for (const auto& nb : r.neighbors()) {
      if (r.receive_and_relax(nb.id, vectors[static_cast<std::size_t>(nb.id)])) changed = true;
    }
    if (changed) ++changed_routers;
  }
  ++round_;
  record();
  logger()->debug("round {}: {} of {} tables changed", round_, changed_routers, routers_.size());

  if (changed_routers == 0 && !converged_) {
    converged_ = true;
    converged_round_ = round_;
    logger()->info("converged at round {}", round_);
  }
  return changed_routers > 0;
}

SimulationResult Simulator::run() {
  while (!converged_) {
    if (round_ >= max_rounds_) {
      logger()->warn("no convergence after {} rounds", round_);
      throw TopologyError("distance vectors did not converge within " + std::to_string(max_rounds_) + " rounds",
                          round_, snapshots_.back());
    }
    step();
  }
  SimulationResult res;
  res.snapshots = snapshots_;
  res.converged_round = converged_round_;
  res.final_tables = tables();
  return res;
}

std::vector<TableSnapshot> Simulator::tables() const {
  std::vector<TableSnapshot> out;
  out.reserve(routers_.size());
  for (const auto& r : routers_) out.push_back(r.snapshot());
  return out;
}

void Simulator::record() {
  if (!opts_.record_snapshots) snapshots_.clear();
  snapshots_.push_back(RoundSnapshot{round_, tables()});
  if (opts_.on_round) opts_.on_round(snapshots_.back());
}

SimulationResult run_simulation(const Topology& topo, const SimulatorOptions& opts) {
  Simulator sim(topo, opts);
  return sim.run();
}

} // namespace dvroute::core
