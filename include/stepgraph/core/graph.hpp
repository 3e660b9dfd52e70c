/* Immutable node-keyed graph with CSR and reverse CSR adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stepgraph/core/types.hpp"

namespace stepgraph::core {

struct NodeSpec {
  std::string key;
  std::optional<Point> position {};
  bool blocked {false};
};

struct EdgeSpec {
  std::string source;
  std::string target;
  Weight weight {1.0};
};

// Notes on identifiers:
// - NodeId and EdgeId are the insertion indices of the specs passed to
//   from_lists(). Node keys are the external, stable identity.
// - Adjacency preserves insertion order; it is the neighbour order every
//   search uses, which keeps step sequences reproducible.
// - An undirected edge appears in the adjacency of both endpoints under a
//   single EdgeId.

class Graph {
public:
  [[nodiscard]] static Graph from_lists(std::span<const NodeSpec> nodes,
                                        std::span<const EdgeSpec> edges,
                                        bool directed);
  ~Graph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(keys_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(weight_.size()); }
  [[nodiscard]] bool directed() const noexcept { return directed_; }

  [[nodiscard]] std::optional<NodeId> find_node(std::string_view key) const;
  [[nodiscard]] const std::string& node_key(NodeId v) const { return keys_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] const std::optional<Point>& position(NodeId v) const { return position_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] bool blocked(NodeId v) const { return blocked_.at(static_cast<std::size_t>(v)) != 0; }
  [[nodiscard]] bool contains(NodeId v) const noexcept { return v >= 0 && v < num_nodes(); }

  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const Weight> weight_view() const noexcept { return weight_; }

  // Outgoing adjacency: for node u, entries [row_offsets[u], row_offsets[u+1])
  // of col_indices (neighbour) and adj_edge_index (EdgeId).
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }
  // Incoming adjacency (equal to outgoing for undirected graphs).
  [[nodiscard]] std::span<const std::int32_t> in_row_offsets_view() const noexcept { return in_row_offsets_; }
  [[nodiscard]] std::span<const NodeId> in_col_indices_view() const noexcept { return in_col_indices_; }
  [[nodiscard]] std::span<const EdgeId> in_adj_edge_index_view() const noexcept { return in_adj_edge_index_; }

  // Cheapest edge traversable from u to v (ties: lowest EdgeId).
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId u, NodeId v) const;
  [[nodiscard]] bool has_negative_weight() const noexcept { return has_negative_; }

private:
  bool directed_ {false};
  bool has_negative_ {false};
  std::vector<std::string> keys_ {};
  std::vector<std::optional<Point>> position_ {};
  std::vector<unsigned char> blocked_ {};
  std::unordered_map<std::string, NodeId> index_ {};

  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  std::vector<Weight> weight_ {};

  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {};
  std::vector<std::int32_t> in_row_offsets_ {};
  std::vector<NodeId> in_col_indices_ {};
  std::vector<EdgeId> in_adj_edge_index_ {};
};

} // namespace stepgraph::core
