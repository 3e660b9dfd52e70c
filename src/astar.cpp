/*
  astar — A* search as a step producer.

  Features:
    - f = g + weight * h with a selectable geometric heuristic.
    - Closed set; a closed neighbour is reported as skipped.
    - Score panel (g, h, f) for every node with a known g.
*/
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/heuristics.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 16> kAStarPseudocode = {
    "AStar(G, s, t, h):",
    "  for each v: g[v] <- inf",
    "  g[s] <- 0; f[s] <- h(s)",
    "  OPEN <- {(f[s], s)}; CLOSED <- {}",
    "  while OPEN is not empty:",
    "    u <- OPEN.extract_min()",
    "    if u in CLOSED or stale: continue",
    "    if u = t: return path(t)",
    "    CLOSED <- CLOSED + {u}",
    "    for each edge (u, v, w) in G.adj(u):",
    "      if v in CLOSED: skip (v)",
    "      tentative <- g[u] + w",
    "      if tentative >= g[v]: skip (v)",
    "      g[v] <- tentative; f[v] <- g[v] + h(v)",
    "      parent[v] <- u; OPEN.insert((f[v], v))",
    "  return unreachable",
};

class AStar final : public detail::SearchBase {
public:
  AStar(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        g_score_(static_cast<std::size_t>(g.num_nodes()), kInf),
        h_score_(static_cast<std::size_t>(g.num_nodes()), 0.0),
        f_score_(static_cast<std::size_t>(g.num_nodes()), kInf),
        closed_(static_cast<std::size_t>(g.num_nodes()), 0),
        parent_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_(static_cast<std::size_t>(g.num_nodes()), -1),
        open_(opts.tie_break) {}

  std::optional<Step> next() override {
    const auto col = g_->col_indices_view();
    const auto aei = g_->adj_edge_index_view();
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          auto si = static_cast<std::size_t>(src_);
          g_score_[si] = 0.0;
          h_score_[si] = h(src_);
          f_score_[si] = h_score_[si];
          open_.push(f_score_[si], src_);
          phase_ = Phase::Pop;
          return sb_.build(3, "g[" + g_->node_key(src_) + "] = 0, f = h = " + detail::fmt(f_score_[si]) + " (" +
                                  std::string(to_string(opts_.heuristic)) + ")",
                           overlay());
        }
        case Phase::Pop: {
          if (open_.empty()) {
            phase_ = Phase::Done;
            return sb_.build_final(15, "Open set exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          auto item = open_.pop();
          auto ui = static_cast<std::size_t>(item.node);
          if (closed_[ui] || item.key > f_score_[ui]) {
            return sb_.build(6, "Pop stale entry " + key(item.node) + " (f = " + detail::fmt(item.key) + ")",
                             overlay());
          }
          u_ = item.node;
          closed_[ui] = 1;
          sb_.expand(u_);
          if (u_ == dst_) {
            phase_ = Phase::Found;
            return sb_.build(7, "Expand " + key(u_) + " (f = " + detail::fmt(f_score_[ui]) + "): target reached",
                             overlay());
          }
          cursor_ = adj_begin(u_);
          end_ = adj_end(u_);
          phase_ = Phase::Scan;
          return sb_.build(8, "Expand " + key(u_) + " (g = " + detail::fmt(g_score_[ui]) + ", f = " +
                                  detail::fmt(f_score_[ui]) + ")",
                           overlay());
        }
        case Phase::Scan: {
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            auto vi = static_cast<std::size_t>(v);
            if (closed_[vi]) {
              sb_.ignore(e);
              return sb_.build(10, key(v) + " is closed; skip", overlay());
            }
            Weight tentative = g_score_[static_cast<std::size_t>(u_)] + weight(e);
            if (tentative < g_score_[vi]) {
              g_score_[vi] = tentative;
              h_score_[vi] = h(v);
              f_score_[vi] = tentative + h_score_[vi];
              parent_[vi] = u_;
              via_[vi] = e;
              open_.push(f_score_[vi], v);
              sb_.discover(v);
              sb_.relax(e);
              return sb_.build(13, "Update " + key(v) + ": g = " + detail::fmt(tentative) + ", f = " +
                                       detail::fmt(f_score_[vi]),
                               overlay());
            }
            sb_.ignore(e);
            return sb_.build(12, "No better g for " + key(v) + " (" + detail::fmt(tentative) + " >= " +
                                     detail::fmt(g_score_[vi]) + ")",
                             overlay());
          }
          phase_ = Phase::Pop;
          continue;
        }
        case Phase::Found: {
          phase_ = Phase::Done;
          auto [nodes, edges] = detail::trace_back(dst_, parent_, via_);
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "Path found: " + detail::join_path(*g_, nodes) + " with cost " + detail::fmt(r.path_cost);
          return sb_.build_final(7, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, Pop, Scan, Found, Done };

  [[nodiscard]] Weight h(NodeId v) const {
    return opts_.heuristic_weight * estimate(opts_.heuristic, *g_, v, dst_);
  }

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.queue = open_.snapshot([this](const detail::Frontier::Item& it) {
      auto i = static_cast<std::size_t>(it.node);
      return !closed_[i] && it.key <= f_score_[i];
    });
    o.distances = g_score_;
    for (NodeId v = 0; v < g_->num_nodes(); ++v) {
      auto i = static_cast<std::size_t>(v);
      if (g_score_[i] < kInf) o.scores.push_back(ScoreRow{v, g_score_[i], h_score_[i], f_score_[i]});
    }
    return o;
  }

  Phase phase_ {Phase::Init};
  std::vector<Weight> g_score_;
  std::vector<Weight> h_score_;
  std::vector<Weight> f_score_;
  std::vector<unsigned char> closed_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  detail::Frontier open_;
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_astar(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "A*");
  return std::make_unique<AStar>(g, src, dst, opts);
}

std::span<const std::string_view> astar_pseudocode() noexcept { return kAStarPseudocode; }

} // namespace stepgraph::core
