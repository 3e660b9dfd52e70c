/*
  bellman_ford — round-based edge relaxation as a step producer.

  Features:
    - Negative edge weights allowed.
    - Arcs are visited in edge insertion order; an undirected edge
      contributes both directions.
    - Early exit when a round changes nothing.
    - Negative-cycle detection covers the whole graph, including cycles
      the source cannot reach: alongside dist[] a zero-initialised
      potential array (a virtual source joined to every node) is relaxed
      silently in each round and checked after the last one.
*/
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 14> kBellmanFordPseudocode = {
    "BellmanFord(G, s, t):",
    "  for each v: dist[v] <- inf",
    "  dist[s] <- 0",
    "  for round <- 1 to |V| - 1:",
    "    changed <- false",
    "    for each edge (u, v, w) in G.edges:",
    "      if dist[u] + w >= dist[v]: skip (u, v)",
    "      dist[v] <- dist[u] + w; parent[v] <- u; changed <- true",
    "    if not changed: break",
    "  for each edge (u, v, w) in G.edges:",
    "    if dist[u] + w < dist[v]:",
    "      return negative cycle",
    "  if dist[t] = inf: return unreachable",
    "  return path(t)",
};

struct Arc {
  NodeId from;
  NodeId to;
  EdgeId edge;
};

class BellmanFord final : public detail::SearchBase {
public:
  BellmanFord(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        dist_(static_cast<std::size_t>(g.num_nodes()), kInf),
        potential_(static_cast<std::size_t>(g.num_nodes()), 0.0),
        parent_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_(static_cast<std::size_t>(g.num_nodes()), -1) {
    const auto es = g.edge_src_view();
    const auto ed = g.edge_dst_view();
    for (EdgeId e = 0; e < g.num_edges(); ++e) {
      NodeId u = es[static_cast<std::size_t>(e)];
      NodeId v = ed[static_cast<std::size_t>(e)];
      if (g.blocked(u) || g.blocked(v)) continue;
      arcs_.push_back(Arc{u, v, e});
      if (!g.directed() && u != v) arcs_.push_back(Arc{v, u, e});
    }
    rounds_ = g.num_nodes() > 0 ? g.num_nodes() - 1 : 0;
  }

  std::optional<Step> next() override {
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          dist_[static_cast<std::size_t>(src_)] = 0.0;
          sb_.visit(src_);
          phase_ = rounds_ > 0 ? Phase::RoundStart : Phase::Check;
          return sb_.build(2, "dist[" + g_->node_key(src_) + "] = 0; " + std::to_string(arcs_.size()) +
                                  " arcs to relax over " + std::to_string(rounds_) + " rounds",
                           overlay());
        }
        case Phase::RoundStart: {
          ++round_;
          cursor_ = 0;
          changed_ = false;
          potential_changed_ = false;
          phase_ = Phase::Scan;
          return sb_.build(3, "Round " + std::to_string(round_) + " of " + std::to_string(rounds_), overlay());
        }
        case Phase::Scan: {
          while (cursor_ < arcs_.size()) {
            const Arc a = arcs_[cursor_++];
            const Weight w = weight(a.edge);
            auto ui = static_cast<std::size_t>(a.from);
            auto vi = static_cast<std::size_t>(a.to);
            if (potential_[ui] + w < potential_[vi]) {
              potential_[vi] = potential_[ui] + w;
              potential_changed_ = true;
            }
            if (dist_[ui] == kInf) continue;
            const Weight alt = dist_[ui] + w;
            if (alt < dist_[vi]) {
              dist_[vi] = alt;
              parent_[vi] = a.from;
              via_[vi] = a.edge;
              changed_ = true;
              sb_.set_node(a.to, NodeState::Frontier);
              sb_.relax(a.edge);
              return sb_.build(7, "Relax " + key(a.from) + " -> " + key(a.to) + ": dist = " + detail::fmt(alt),
                               overlay());
            }
            sb_.ignore(a.edge);
            return sb_.build(6, "No improvement via " + key(a.from) + " -> " + key(a.to), overlay());
          }
          phase_ = Phase::RoundEnd;
          continue;
        }
        case Phase::RoundEnd: {
          for (NodeId v = 0; v < g_->num_nodes(); ++v) {
            if (sb_.state(v) == NodeState::Frontier) sb_.visit(v);
          }
          const bool converged = !changed_ && !potential_changed_;
          std::string msg = "Round " + std::to_string(round_) + " complete";
          if (!changed_) msg += "; no distance changed";
          if (converged || round_ >= rounds_) {
            phase_ = Phase::Check;
            if (converged) msg += "; converged early";
          } else {
            phase_ = Phase::RoundStart;
          }
          return sb_.build(8, std::move(msg), overlay());
        }
        case Phase::Check: {
          phase_ = Phase::Done;
          for (const auto& a : arcs_) {
            const Weight w = weight(a.edge);
            auto ui = static_cast<std::size_t>(a.from);
            auto vi = static_cast<std::size_t>(a.to);
            const bool reachable_cycle = dist_[ui] != kInf && dist_[ui] + w < dist_[vi];
            if (reachable_cycle || potential_[ui] + w < potential_[vi]) {
              sb_.set_current_edge(a.edge);
              RunResult r;
              r.negative_cycle = true;
              return sb_.build_final(11, "Negative cycle detected through " + key(a.from) + " -> " + key(a.to),
                                     overlay(), std::move(r));
            }
          }
          if (dist_[static_cast<std::size_t>(dst_)] == kInf) {
            return sb_.build_final(12, "No negative cycle; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          auto [nodes, edges] = detail::trace_back(dst_, parent_, via_);
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "No negative cycle; shortest path " + detail::join_path(*g_, nodes) + " with cost " +
                            detail::fmt(r.path_cost);
          return sb_.build_final(13, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, RoundStart, Scan, RoundEnd, Check, Done };

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.distances = dist_;
    o.round = round_;
    return o;
  }

  Phase phase_ {Phase::Init};
  std::vector<Arc> arcs_ {};
  std::vector<Weight> dist_;
  std::vector<Weight> potential_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  std::int32_t rounds_ {0};
  std::int32_t round_ {0};
  std::size_t cursor_ {0};
  bool changed_ {false};
  bool potential_changed_ {false};
};

} // namespace

StepProducerPtr make_bellman_ford(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, true, "Bellman-Ford");
  return std::make_unique<BellmanFord>(g, src, dst, opts);
}

std::span<const std::string_view> bellman_ford_pseudocode() noexcept { return kBellmanFordPseudocode; }

} // namespace stepgraph::core
