/* Immutable undirected link topology with CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "dvroute/core/types.hpp"

namespace dvroute::core {

// Edge keyed by router labels, as written in a topology file.
struct LabeledEdge {
  std::string a;
  std::string b;
  Cost cost;
};

// Notes on node identifiers:
// - NodeId is the router's index in [0, num_nodes). When built from labels,
//   ids follow ascending label order so that id order and label order agree.
// - Every undirected link is stored in both directions in the CSR arrays;
//   neighbors of a node are sorted by id for deterministic iteration.
class Topology {
public:
  // Builds from labeled edges; the node universe is the set of endpoints.
  [[nodiscard]] static Topology from_edges(std::span<const LabeledEdge> edges);

  // Builds from parallel arrays over ids [0, num_nodes). Labels default to
  // the decimal id.
  [[nodiscard]] static Topology from_arrays(
      std::int32_t num_nodes,
      std::span<const NodeId> src,
      std::span<const NodeId> dst,
      std::span<const Cost> cost);
  ~Topology() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  // Undirected link count.
  [[nodiscard]] std::int32_t num_links() const noexcept { return static_cast<std::int32_t>(col_indices_.size() / 2); }

  [[nodiscard]] const std::string& name(NodeId u) const { return names_.at(static_cast<std::size_t>(u)); }
  [[nodiscard]] std::optional<NodeId> find(std::string_view label) const;

  // Direct link cost between u and v, if they are adjacent.
  [[nodiscard]] std::optional<Cost> link_cost(NodeId u, NodeId v) const;
  [[nodiscard]] std::vector<Neighbor> neighbors(NodeId u) const;

  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const Cost> adj_cost_view() const noexcept { return adj_cost_; }

private:
  Topology() = default;

  // Shared validation and CSR construction; names[u] labels node u in errors.
  static Topology build(std::int32_t num_nodes,
                        std::span<const NodeId> src,
                        std::span<const NodeId> dst,
                        std::span<const Cost> cost,
                        std::vector<std::string> names);

  std::int32_t num_nodes_ {0};
  std::vector<std::string> names_ {};

  // CSR adjacency, both directions of every link
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<Cost> adj_cost_ {};
};

} // namespace dvroute::core
