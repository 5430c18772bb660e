/*
  shortest_paths — Dijkstra over a Topology.

  Single-path mode only: each node keeps the first hop of one best path, with
  equal-cost ties resolved toward the smaller first-hop id so the result is
  reproducible. verify_tables reuses it as an independent check of converged
  distance-vector tables.
*/
#include "dvroute/core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>
#include <utility>

#include "dvroute/core/constants.hpp"

namespace dvroute::core {

SpfResult shortest_paths(const Topology& topo, NodeId src) {
  const auto N = topo.num_nodes();
  if (src < 0 || src >= N) {
    throw std::out_of_range("shortest_paths: src out of range");
  }
  const auto row = topo.row_offsets_view();
  const auto col = topo.col_indices_view();
  const auto cost = topo.adj_cost_view();

  SpfResult res;
  res.dist.assign(static_cast<std::size_t>(N), kInfCost);
  res.first_hop.assign(static_cast<std::size_t>(N), kNoNode);
  res.dist[static_cast<std::size_t>(src)] = 0.0;
  res.first_hop[static_cast<std::size_t>(src)] = src;

  using QItem = std::pair<Cost, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  pq.emplace(0.0, src);

  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    auto u_idx = static_cast<std::size_t>(u);
    if (d_u > res.dist[u_idx]) continue;

    auto start = static_cast<std::size_t>(row[u_idx]);
    auto end   = static_cast<std::size_t>(row[u_idx + 1]);
    for (std::size_t j = start; j < end; ++j) {
      NodeId v = col[j];
      auto v_idx = static_cast<std::size_t>(v);
      const Cost new_cost = d_u + cost[j];
      const NodeId hop = (u == src) ? v : res.first_hop[u_idx];
      if (new_cost < res.dist[v_idx]) {
        res.dist[v_idx] = new_cost;
        res.first_hop[v_idx] = hop;
        pq.emplace(new_cost, v);
      } else if (new_cost == res.dist[v_idx] && hop < res.first_hop[v_idx]) {
        // Deterministic: smallest first hop among equal-cost paths
        res.first_hop[v_idx] = hop;
      }
    }
  }
  return res;
}

std::vector<std::string>
verify_tables(const Topology& topo, const std::vector<TableSnapshot>& tables, double rel_tol) {
  std::vector<std::string> mismatches;
  if (tables.size() != static_cast<std::size_t>(topo.num_nodes())) {
    mismatches.push_back("expected " + std::to_string(topo.num_nodes()) + " tables, got " +
                         std::to_string(tables.size()));
    return mismatches;
  }
  for (NodeId u = 0; u < topo.num_nodes(); ++u) {
    const auto ref = shortest_paths(topo, u);
    const auto& table = tables[static_cast<std::size_t>(u)];
    if (table.size() != static_cast<std::size_t>(topo.num_nodes())) {
      mismatches.push_back(topo.name(u) + ": expected " + std::to_string(topo.num_nodes()) +
                           " entries, got " + std::to_string(table.size()));
      continue;
    }
    for (const auto& e : table) {
      if (e.dst < 0 || e.dst >= topo.num_nodes()) {
        mismatches.push_back(topo.name(u) + ": destination id " + std::to_string(e.dst) + " out of range");
        continue;
      }
      const Cost want = ref.dist[static_cast<std::size_t>(e.dst)];
      const bool same = (std::isinf(want) && std::isinf(e.cost)) ||
                        std::abs(e.cost - want) <= rel_tol * std::max(1.0, std::abs(want));
      if (!same) {
        mismatches.push_back(topo.name(u) + " -> " + topo.name(e.dst) + ": table cost " +
                             std::to_string(e.cost) + ", shortest path " + std::to_string(want));
      }
    }
  }
  return mismatches;
}

} // namespace dvroute::core
