/* Per-router routing table with Bellman-Ford relaxation. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "dvroute/core/types.hpp"

namespace dvroute::core {

// Dense table over destinations [0, num_nodes). Owned by exactly one Router.
class RoutingTable {
public:
  // Seeds self -> (0, self), each direct neighbor -> (link cost, neighbor) and
  // every other destination -> (inf, kNoNode).
  RoutingTable(NodeId self, std::span<const Neighbor> neighbors, std::int32_t num_nodes);

  // Relaxes against a vector advertised by `via` over a link of cost
  // link_cost: an entry is replaced only on strict improvement, so equal-cost
  // alternatives keep the current next-hop. Returns true if any entry changed.
  // Throws ConfigurationError if the vector does not cover every destination.
  bool relax(NodeId via, const DistanceVector& advertised, Cost link_cost);

  // Destination -> cost projection advertised to neighbors.
  [[nodiscard]] DistanceVector as_vector() const;

  // Value copy ordered by destination.
  [[nodiscard]] TableSnapshot snapshot() const { return entries_; }

  [[nodiscard]] const RoutingEntry& entry(NodeId dst) const { return entries_.at(static_cast<std::size_t>(dst)); }
  [[nodiscard]] NodeId self() const noexcept { return self_; }
  [[nodiscard]] std::int32_t size() const noexcept { return static_cast<std::int32_t>(entries_.size()); }

private:
  NodeId self_ {0};
  std::vector<RoutingEntry> entries_ {};  // indexed by destination id
};

} // namespace dvroute::core
