/* One simulated router: its link costs and its own routing table. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "dvroute/core/routing_table.hpp"
#include "dvroute/core/types.hpp"

namespace dvroute::core {

// A Router reasons only from its direct links and the vectors handed to it.
// It holds no reference to other routers; the Simulator carries vectors
// between neighbors.
class Router {
public:
  Router(NodeId id, std::vector<Neighbor> neighbors, std::int32_t num_nodes);

  // Vector to advertise to neighbors this round.
  [[nodiscard]] DistanceVector current_vector() const { return table_.as_vector(); }

  // Relaxes against a vector received from a direct neighbor. Throws
  // ConfigurationError when `from` is not linked to this router.
  bool receive_and_relax(NodeId from, const DistanceVector& vector);

  [[nodiscard]] TableSnapshot snapshot() const { return table_.snapshot(); }
  [[nodiscard]] const RoutingTable& table() const noexcept { return table_; }
  [[nodiscard]] NodeId id() const noexcept { return id_; }
  [[nodiscard]] std::span<const Neighbor> neighbors() const noexcept { return neighbors_; }

private:
  NodeId id_ {0};
  std::vector<Neighbor> neighbors_ {};  // sorted by id
  RoutingTable table_;
};

} // namespace dvroute::core
