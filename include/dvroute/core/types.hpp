/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 (dense router index, matches np.int32)
 * - Cost: double (matches np.float64; +inf marks an unreachable destination)
 * - DistanceVector: std::vector<Cost> indexed by destination (like a list)
 */
#pragma once

#include <cstdint>
#include <vector>

namespace dvroute::core {

// Router identifiers are dense signed 32-bit integers in [0, num_nodes).
using NodeId = std::int32_t;
using Cost   = double;  // Link or path cost

// Advertised payload: destination -> believed cost. Next-hops never leave a router.
using DistanceVector = std::vector<Cost>;

// One row of a routing table.
// next_hop is a direct neighbor of the owning router, the router itself for
// the self entry, or kNoNode while the destination is still unknown.
struct RoutingEntry {
  NodeId dst;
  Cost   cost;
  NodeId next_hop;
  friend bool operator==(const RoutingEntry& a, const RoutingEntry& b) noexcept {
    return a.dst==b.dst && a.cost==b.cost && a.next_hop==b.next_hop;
  }
};

// Value copy of one table, ordered by destination id.
using TableSnapshot = std::vector<RoutingEntry>;

// Every router's table at the end of a round. tables[u] belongs to router u.
// Round 0 is the seeded state before any exchange.
struct RoundSnapshot {
  std::int32_t round {0};
  std::vector<TableSnapshot> tables;
  friend bool operator==(const RoundSnapshot& a, const RoundSnapshot& b) noexcept {
    return a.round==b.round && a.tables==b.tables;
  }
};

// A (neighbor, link cost) pair as seen from one router.
struct Neighbor {
  NodeId id;
  Cost   cost;
};

} // namespace dvroute::core
