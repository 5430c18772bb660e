/*
  RoutingTable — one router's best-known distances.

  Relaxation is the distance-vector form of the Bellman-Ford update:
  cost(self, d) = min over neighbors n of link(self, n) + cost(n, d).
  Only strict improvements are accepted, which keeps next-hops stable on ties.
*/
#include "dvroute/core/routing_table.hpp"

#include <cmath>
#include <string>

#include "dvroute/core/constants.hpp"
#include "dvroute/core/error.hpp"

namespace dvroute::core {

RoutingTable::RoutingTable(NodeId self, std::span<const Neighbor> neighbors, std::int32_t num_nodes)
  : self_(self) {
  if (num_nodes <= 0 || self < 0 || self >= num_nodes) {
    throw ConfigurationError("router id " + std::to_string(self) + " outside node universe");
  }
  entries_.reserve(static_cast<std::size_t>(num_nodes));
  for (NodeId d = 0; d < num_nodes; ++d) {
    entries_.push_back(RoutingEntry{d, kInfCost, kNoNode});
  }
  entries_[static_cast<std::size_t>(self)] = RoutingEntry{self, 0.0, self};
  for (const auto& n : neighbors) {
    if (n.id < 0 || n.id >= num_nodes || n.id == self) {
      throw ConfigurationError("invalid neighbor " + std::to_string(n.id) + " for router " + std::to_string(self));
    }
    if (!std::isfinite(n.cost) || n.cost <= 0.0) {
      throw ConfigurationError("link " + std::to_string(self) + "-" + std::to_string(n.id) +
                               " must have a positive finite cost");
    }
    if (entries_[static_cast<std::size_t>(n.id)].next_hop != kNoNode) {
      throw ConfigurationError("duplicate neighbor " + std::to_string(n.id) + " for router " + std::to_string(self));
    }
    entries_[static_cast<std::size_t>(n.id)] = RoutingEntry{n.id, n.cost, n.id};
  }
}

bool RoutingTable::relax(NodeId via, const DistanceVector& advertised, Cost link_cost) {
  if (advertised.size() != entries_.size()) {
    throw ConfigurationError("advertised vector from " + std::to_string(via) + " has " +
                             std::to_string(advertised.size()) + " entries, expected " +
                             std::to_string(entries_.size()));
  }
  bool changed = false;
  for (std::size_t d = 0; d < entries_.size(); ++d) {
    if (static_cast<NodeId>(d) == self_) continue;  // self entry is fixed at 0
    // inf + finite stays inf and never compares below the current cost
    const Cost candidate = link_cost + advertised[d];
    auto& cur = entries_[d];
    if (candidate < cur.cost) {
      cur.cost = candidate;
      cur.next_hop = via;
      changed = true;
    }
  }
  return changed;
}

DistanceVector RoutingTable::as_vector() const {
  DistanceVector v;
  v.reserve(entries_.size());
  for (const auto& e : entries_) v.push_back(e.cost);
  return v;
}

} // namespace dvroute::core
