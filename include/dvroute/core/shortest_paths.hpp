/* Centralized shortest paths (Dijkstra) over a Topology, used as a reference
   for converged distance-vector tables. */
#pragma once

#include <string>
#include <vector>

#include "dvroute/core/topology.hpp"
#include "dvroute/core/types.hpp"

namespace dvroute::core {

// dist[v] is the shortest-path cost from src to v (kInfCost if unreachable).
// first_hop[v] is the neighbor of src on one shortest path (src for v == src,
// kNoNode if unreachable). Ties pick the smallest first hop.
struct SpfResult {
  std::vector<Cost> dist;
  std::vector<NodeId> first_hop;
};

[[nodiscard]] SpfResult shortest_paths(const Topology& topo, NodeId src);

// Compares converged tables with Dijkstra from every node. Returns one
// human-readable line per mismatching (router, destination); empty if all
// costs agree within rel_tol.
[[nodiscard]] std::vector<std::string>
verify_tables(const Topology& topo, const std::vector<TableSnapshot>& tables, double rel_tol = 1e-9);

} // namespace dvroute::core
