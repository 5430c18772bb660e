/*
  Topology — immutable undirected link graph with deterministic layout.

  Construction validates inputs eagerly (ids, self-loops, positive finite
  costs, conflicting duplicates, connectivity) and compacts links into a CSR
  adjacency holding both directions, neighbors sorted by id.
*/
#include "dvroute/core/topology.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <queue>
#include <set>
#include <unordered_map>

#include "dvroute/core/error.hpp"

namespace dvroute::core {

Topology Topology::from_edges(std::span<const LabeledEdge> edges) {
  // Node universe: every endpoint mentioned. std::set orders labels.
  std::set<std::string> labels;
  for (const auto& e : edges) {
    labels.insert(e.a);
    labels.insert(e.b);
  }
  std::vector<std::string> names(labels.begin(), labels.end());
  std::unordered_map<std::string, NodeId> index;
  index.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    index.emplace(names[i], static_cast<NodeId>(i));
  }

  std::vector<NodeId> src_v;
  std::vector<NodeId> dst_v;
  std::vector<Cost> cost_v;
  src_v.reserve(edges.size());
  dst_v.reserve(edges.size());
  cost_v.reserve(edges.size());
  for (const auto& e : edges) {
    src_v.push_back(index.at(e.a));
    dst_v.push_back(index.at(e.b));
    cost_v.push_back(e.cost);
  }
  return build(static_cast<std::int32_t>(names.size()), src_v, dst_v, cost_v, std::move(names));
}

Topology Topology::from_arrays(
    std::int32_t num_nodes,
    std::span<const NodeId> src,
    std::span<const NodeId> dst,
    std::span<const Cost> cost) {
  std::vector<std::string> names;
  if (num_nodes > 0) {
    names.reserve(static_cast<std::size_t>(num_nodes));
    for (std::int32_t i = 0; i < num_nodes; ++i) names.push_back(std::to_string(i));
  }
  return build(num_nodes, src, dst, cost, std::move(names));
}

Topology Topology::build(std::int32_t num_nodes,
                         std::span<const NodeId> src,
                         std::span<const NodeId> dst,
                         std::span<const Cost> cost,
                         std::vector<std::string> names) {
  if (num_nodes <= 0) {
    throw ConfigurationError("topology must contain at least one node");
  }
  if (src.size() != dst.size() || src.size() != cost.size()) {
    throw ConfigurationError("src, dst, and cost must have the same length");
  }
  const std::size_t m = src.size();

  // Invariants: ids within [0, num_nodes), no self-loops, positive finite costs
  for (std::size_t i = 0; i < m; ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw ConfigurationError("link endpoint out of range of num_nodes");
    }
    const auto& a = names[static_cast<std::size_t>(src[i])];
    const auto& b = names[static_cast<std::size_t>(dst[i])];
    if (src[i] == dst[i]) {
      throw ConfigurationError("self-loop on node " + a);
    }
    if (!std::isfinite(cost[i]) || cost[i] <= 0.0) {
      throw ConfigurationError("link " + a + "-" + b + " must have a positive finite cost");
    }
  }

  // Canonicalize each link as (min, max) and sort so duplicates are adjacent.
  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  auto lo = [&](std::size_t i) { return std::min(src[i], dst[i]); };
  auto hi = [&](std::size_t i) { return std::max(src[i], dst[i]); };
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (lo(a) != lo(b)) return lo(a) < lo(b);
    return hi(a) < hi(b);
  });
  std::vector<NodeId> link_a;
  std::vector<NodeId> link_b;
  std::vector<Cost> link_cost;
  link_a.reserve(m);
  link_b.reserve(m);
  link_cost.reserve(m);
  for (auto i : idx) {
    if (!link_a.empty() && link_a.back() == lo(i) && link_b.back() == hi(i)) {
      if (link_cost.back() != cost[i]) {
        throw ConfigurationError("conflicting costs for link " +
                                 names[static_cast<std::size_t>(lo(i))] + "-" +
                                 names[static_cast<std::size_t>(hi(i))]);
      }
      continue;  // exact duplicate collapses into one link
    }
    link_a.push_back(lo(i));
    link_b.push_back(hi(i));
    link_cost.push_back(cost[i]);
  }
  const std::size_t links = link_a.size();

  Topology t;
  t.num_nodes_ = num_nodes;
  t.names_ = std::move(names);

  // Build CSR adjacency with both directions
  t.row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < links; ++i) {
    t.row_offsets_[static_cast<std::size_t>(link_a[i]) + 1]++;
    t.row_offsets_[static_cast<std::size_t>(link_b[i]) + 1]++;
  }
  for (std::size_t i = 1; i < t.row_offsets_.size(); ++i) {
    t.row_offsets_[i] += t.row_offsets_[i - 1];
  }
  t.col_indices_.resize(2 * links);
  t.adj_cost_.resize(2 * links);
  std::vector<std::int32_t> cursor = t.row_offsets_;
  auto put = [&](NodeId u, NodeId v, Cost c) {
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    t.col_indices_[pos] = v;
    t.adj_cost_[pos] = c;
  };
  for (std::size_t i = 0; i < links; ++i) {
    put(link_a[i], link_b[i], link_cost[i]);
    put(link_b[i], link_a[i], link_cost[i]);
  }
  // Sort each row by neighbor id
  for (std::int32_t u = 0; u < num_nodes; ++u) {
    auto s = static_cast<std::size_t>(t.row_offsets_[static_cast<std::size_t>(u)]);
    auto e = static_cast<std::size_t>(t.row_offsets_[static_cast<std::size_t>(u) + 1]);
    std::vector<std::pair<NodeId, Cost>> row;
    row.reserve(e - s);
    for (std::size_t j = s; j < e; ++j) row.emplace_back(t.col_indices_[j], t.adj_cost_[j]);
    std::sort(row.begin(), row.end(), [](auto const& a, auto const& b){ return a.first < b.first; });
    for (std::size_t j = s; j < e; ++j) {
      t.col_indices_[j] = row[j - s].first;
      t.adj_cost_[j] = row[j - s].second;
    }
  }

  // Connectivity: BFS from node 0 must reach every node
  std::vector<bool> seen(static_cast<std::size_t>(num_nodes), false);
  std::queue<NodeId> q;
  seen[0] = true;
  q.push(0);
  std::int32_t reached = 1;
  while (!q.empty()) {
    NodeId u = q.front(); q.pop();
    auto s = static_cast<std::size_t>(t.row_offsets_[static_cast<std::size_t>(u)]);
    auto e = static_cast<std::size_t>(t.row_offsets_[static_cast<std::size_t>(u) + 1]);
    for (std::size_t j = s; j < e; ++j) {
      auto v = static_cast<std::size_t>(t.col_indices_[j]);
      if (!seen[v]) { seen[v] = true; ++reached; q.push(t.col_indices_[j]); }
    }
  }
  if (reached != num_nodes) {
    for (std::int32_t v = 0; v < num_nodes; ++v) {
      if (!seen[static_cast<std::size_t>(v)]) {
        throw ConfigurationError("topology is disconnected: " + t.names_[static_cast<std::size_t>(v)] +
                                 " is unreachable from " + t.names_[0]);
      }
    }
  }
  return t;
}

std::optional<NodeId> Topology::find(std::string_view label) const {
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == label) return static_cast<NodeId>(i);
  }
  return std::nullopt;
}

std::optional<Cost> Topology::link_cost(NodeId u, NodeId v) const {
  if (u < 0 || u >= num_nodes_) return std::nullopt;
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  auto first = col_indices_.begin() + static_cast<std::ptrdiff_t>(s);
  auto last = col_indices_.begin() + static_cast<std::ptrdiff_t>(e);
  auto it = std::lower_bound(first, last, v);
  if (it == last || *it != v) return std::nullopt;
  return adj_cost_[static_cast<std::size_t>(it - col_indices_.begin())];
}

std::vector<Neighbor> Topology::neighbors(NodeId u) const {
  if (u < 0 || u >= num_nodes_) {
    throw std::out_of_range("node id out of range");
  }
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  std::vector<Neighbor> out;
  out.reserve(e - s);
  for (std::size_t j = s; j < e; ++j) out.push_back(Neighbor{col_indices_[j], adj_cost_[j]});
  return out;
}

} // namespace dvroute::core
