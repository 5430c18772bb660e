#include "dvroute/core/router.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "dvroute/core/error.hpp"

namespace dvroute::core {

namespace {
std::vector<Neighbor> sorted_neighbors(std::vector<Neighbor> neighbors) {
  std::sort(neighbors.begin(), neighbors.end(),
            [](const Neighbor& a, const Neighbor& b) { return a.id < b.id; });
  return neighbors;
}
} // namespace

Router::Router(NodeId id, std::vector<Neighbor> neighbors, std::int32_t num_nodes)
  : id_(id),
    neighbors_(sorted_neighbors(std::move(neighbors))),
    table_(id, neighbors_, num_nodes) {}

bool Router::receive_and_relax(NodeId from, const DistanceVector& vector) {
  auto it = std::lower_bound(neighbors_.begin(), neighbors_.end(), from,
                             [](const Neighbor& n, NodeId v) { return n.id < v; });
  if (it == neighbors_.end() || it->id != from) {
    throw ConfigurationError("router " + std::to_string(id_) + " has no link to " + std::to_string(from));
  }
  return table_.relax(from, vector, it->cost);
}

} // namespace dvroute::core
