/*
  Internal helpers shared by the algorithm state machines: request
  validation, the tie-breaking priority frontier, predecessor-chain path
  reconstruction and explanation formatting.
*/
#pragma once

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "stepgraph/core/error.hpp"
#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/options.hpp"
#include "stepgraph/core/step.hpp"
#include "stepgraph/core/step_producer.hpp"

namespace stepgraph::core::detail {

inline void validate_request(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts,
                             bool allow_negative, const char* algorithm) {
  if (!g.contains(src)) throw ConfigError(std::string(algorithm) + ": source id out of range");
  if (!g.contains(dst)) throw ConfigError(std::string(algorithm) + ": target id out of range");
  if (g.blocked(src)) throw ConfigError(std::string(algorithm) + ": source '" + g.node_key(src) + "' is blocked");
  if (g.blocked(dst)) throw ConfigError(std::string(algorithm) + ": target '" + g.node_key(dst) + "' is blocked");
  if (!allow_negative && g.has_negative_weight()) {
    throw ConfigError(std::string(algorithm) + " requires non-negative edge weights");
  }
  validate(opts);
}

// Min-priority frontier with explicit tie-breaking. Entries are never
// decreased in place; superseded entries stay in the heap and are skipped
// as stale when popped.
class Frontier {
public:
  struct Item {
    Weight key;
    NodeId node;
    std::int64_t seq;
  };

  explicit Frontier(TieBreak tie) : tie_(tie) {}

  void push(Weight key, NodeId node) {
    heap_.push_back(Item{key, node, seq_++});
    std::push_heap(heap_.begin(), heap_.end(), Greater{tie_});
  }
  [[nodiscard]] Item pop() {
    std::pop_heap(heap_.begin(), heap_.end(), Greater{tie_});
    Item top = heap_.back();
    heap_.pop_back();
    return top;
  }
  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }

  // Entries in pop order, filtered by keep(item).
  template <typename Keep>
  [[nodiscard]] std::vector<QueueEntry> snapshot(Keep keep) const {
    std::vector<Item> items;
    items.reserve(heap_.size());
    for (const auto& it : heap_) if (keep(it)) items.push_back(it);
    std::sort(items.begin(), items.end(), Less{tie_});
    std::vector<QueueEntry> out;
    out.reserve(items.size());
    for (const auto& it : items) out.push_back(QueueEntry{it.node, it.key});
    return out;
  }

private:
  struct Less {
    TieBreak tie;
    bool operator()(const Item& a, const Item& b) const noexcept {
      if (a.key != b.key) return a.key < b.key;
      if (tie == TieBreak::LowestNodeId && a.node != b.node) return a.node < b.node;
      return a.seq < b.seq;
    }
  };
  struct Greater {
    TieBreak tie;
    bool operator()(const Item& a, const Item& b) const noexcept { return Less{tie}(b, a); }
  };

  TieBreak tie_;
  std::int64_t seq_ {0};
  std::vector<Item> heap_ {};
};

// Walk predecessor links back from target; returns (nodes, edges) ordered
// source to target. Stops after |V| hops so malformed links cannot loop.
inline std::pair<std::vector<NodeId>, std::vector<EdgeId>>
trace_back(NodeId target, const std::vector<NodeId>& parent, const std::vector<EdgeId>& via) {
  std::vector<NodeId> nodes {target};
  std::vector<EdgeId> edges;
  NodeId cur = target;
  std::size_t guard = parent.size();
  while (parent[static_cast<std::size_t>(cur)] >= 0 && guard-- > 0) {
    edges.push_back(via[static_cast<std::size_t>(cur)]);
    cur = parent[static_cast<std::size_t>(cur)];
    nodes.push_back(cur);
  }
  std::reverse(nodes.begin(), nodes.end());
  std::reverse(edges.begin(), edges.end());
  return {std::move(nodes), std::move(edges)};
}

inline RunResult path_result(const Graph& g, std::vector<NodeId> nodes, std::vector<EdgeId> edges) {
  RunResult r;
  const auto w = g.weight_view();
  Weight cost = 0.0;
  for (auto e : edges) cost += w[static_cast<std::size_t>(e)];
  r.path = std::move(nodes);
  r.path_edges = std::move(edges);
  r.path_cost = cost;
  return r;
}

inline std::string fmt(Weight w) {
  std::ostringstream os;
  os << w;
  return os.str();
}

inline std::string quoted(const Graph& g, NodeId v) { return "'" + g.node_key(v) + "'"; }

inline std::string join_path(const Graph& g, const std::vector<NodeId>& nodes) {
  std::string out;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (i) out += " -> ";
    out += g.node_key(nodes[i]);
  }
  return out;
}

// Base for the per-algorithm state machines: graph, endpoints and builder.
class SearchBase : public StepProducer {
protected:
  SearchBase(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : g_(&g), src_(src), dst_(dst), opts_(opts), sb_(g) {}

  [[nodiscard]] std::size_t adj_begin(NodeId u) const {
    return static_cast<std::size_t>(g_->row_offsets_view()[static_cast<std::size_t>(u)]);
  }
  [[nodiscard]] std::size_t adj_end(NodeId u) const {
    return static_cast<std::size_t>(g_->row_offsets_view()[static_cast<std::size_t>(u) + 1]);
  }
  [[nodiscard]] Weight weight(EdgeId e) const { return g_->weight_view()[static_cast<std::size_t>(e)]; }
  [[nodiscard]] std::string key(NodeId v) const { return quoted(*g_, v); }

  const Graph* g_;
  NodeId src_;
  NodeId dst_;
  SearchOptions opts_;
  StepBuilder sb_;
};

} // namespace stepgraph::core::detail
