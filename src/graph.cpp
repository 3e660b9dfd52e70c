/*
  Graph — immutable node-keyed graph with deterministic adjacency.

  Construction validates the node and edge lists, assigns dense ids in
  insertion order, expands undirected edges into two arcs sharing one EdgeId
  and compacts the arcs into CSR adjacency (and reverse CSR) with a stable
  counting sort, so each node's neighbours keep edge insertion order.
*/
#include "stepgraph/core/graph.hpp"

#include <cmath>

#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

namespace {
struct Arc {
  NodeId tail;
  NodeId head;
  EdgeId edge;
};

// Stable CSR build keyed by key(arc); fills offsets, neighbour and edge index.
template <typename KeyFn, typename OtherFn>
void build_csr(std::size_t num_nodes, const std::vector<Arc>& arcs, KeyFn key, OtherFn other,
               std::vector<std::int32_t>& offsets, std::vector<NodeId>& cols,
               std::vector<EdgeId>& edge_index) {
  offsets.assign(num_nodes + 1, 0);
  for (const auto& a : arcs) {
    offsets[static_cast<std::size_t>(key(a)) + 1]++;
  }
  for (std::size_t i = 1; i < offsets.size(); ++i) {
    offsets[i] += offsets[i - 1];
  }
  cols.resize(arcs.size());
  edge_index.resize(arcs.size());
  std::vector<std::int32_t> cursor = offsets;
  for (const auto& a : arcs) {
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(key(a))]++);
    cols[pos] = other(a);
    edge_index[pos] = a.edge;
  }
}
} // namespace

Graph Graph::from_lists(std::span<const NodeSpec> nodes,
                        std::span<const EdgeSpec> edges,
                        bool directed) {
  Graph g;
  g.directed_ = directed;
  const std::size_t n = nodes.size();
  g.keys_.reserve(n);
  g.position_.reserve(n);
  g.blocked_.reserve(n);
  g.index_.reserve(n);

  // Invariants: non-empty unique keys
  for (const auto& spec : nodes) {
    if (spec.key.empty()) {
      throw GraphError("node key must not be empty");
    }
    auto id = static_cast<NodeId>(g.keys_.size());
    if (!g.index_.emplace(spec.key, id).second) {
      throw GraphError("duplicate node key '" + spec.key + "'");
    }
    g.keys_.push_back(spec.key);
    g.position_.push_back(spec.position);
    g.blocked_.push_back(spec.blocked ? 1 : 0);
  }

  // Invariants: endpoints exist, weights finite
  const std::size_t m = edges.size();
  g.src_.reserve(m);
  g.dst_.reserve(m);
  g.weight_.reserve(m);
  for (const auto& spec : edges) {
    auto s = g.find_node(spec.source);
    auto t = g.find_node(spec.target);
    if (!s) throw GraphError("edge references unknown node '" + spec.source + "'");
    if (!t) throw GraphError("edge references unknown node '" + spec.target + "'");
    if (!std::isfinite(spec.weight)) {
      throw GraphError("edge " + spec.source + "->" + spec.target + " has a non-finite weight");
    }
    if (spec.weight < 0.0) g.has_negative_ = true;
    g.src_.push_back(*s);
    g.dst_.push_back(*t);
    g.weight_.push_back(spec.weight);
  }

  // Expand to arcs; an undirected non-loop edge is traversable both ways.
  std::vector<Arc> arcs;
  arcs.reserve(directed ? m : 2 * m);
  for (std::size_t e = 0; e < m; ++e) {
    auto eid = static_cast<EdgeId>(e);
    arcs.push_back(Arc{g.src_[e], g.dst_[e], eid});
    if (!directed && g.src_[e] != g.dst_[e]) {
      arcs.push_back(Arc{g.dst_[e], g.src_[e], eid});
    }
  }

  build_csr(n, arcs,
            [](const Arc& a) { return a.tail; }, [](const Arc& a) { return a.head; },
            g.row_offsets_, g.col_indices_, g.adj_edge_index_);
  build_csr(n, arcs,
            [](const Arc& a) { return a.head; }, [](const Arc& a) { return a.tail; },
            g.in_row_offsets_, g.in_col_indices_, g.in_adj_edge_index_);
  return g;
}

std::optional<NodeId> Graph::find_node(std::string_view key) const {
  auto it = index_.find(std::string(key));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeId> Graph::find_edge(NodeId u, NodeId v) const {
  if (!contains(u) || !contains(v)) return std::nullopt;
  std::optional<EdgeId> best;
  auto start = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto end = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  for (std::size_t i = start; i < end; ++i) {
    if (col_indices_[i] != v) continue;
    EdgeId e = adj_edge_index_[i];
    auto w = weight_[static_cast<std::size_t>(e)];
    if (!best || w < weight_[static_cast<std::size_t>(*best)] ||
        (w == weight_[static_cast<std::size_t>(*best)] && e < *best)) {
      best = e;
    }
  }
  return best;
}

} // namespace stepgraph::core
