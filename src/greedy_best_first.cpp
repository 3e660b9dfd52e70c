/* Greedy best-first search: frontier ordered by heuristic estimate alone. */
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/heuristics.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 13> kGreedyPseudocode = {
    "GreedyBestFirst(G, s, t, h):",
    "  OPEN <- {(h(s), s)}; mark s discovered",
    "  CLOSED <- {}",
    "  while OPEN is not empty:",
    "    u <- OPEN.extract_min()",
    "    if u in CLOSED: continue",
    "    CLOSED <- CLOSED + {u}",
    "    if u = t: return path(t)",
    "    for each edge (u, v) in G.adj(u):",
    "      if v in CLOSED or discovered: skip (v)",
    "      mark v discovered; parent[v] <- u",
    "      OPEN.insert((h(v), v))",
    "  return unreachable",
};

class GreedyBestFirst final : public detail::SearchBase {
public:
  GreedyBestFirst(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        h_score_(static_cast<std::size_t>(g.num_nodes()), 0.0),
        discovered_(static_cast<std::size_t>(g.num_nodes()), 0),
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
          h_score_[si] = h(src_);
          discovered_[si] = 1;
          open_.push(h_score_[si], src_);
          phase_ = Phase::Pop;
          return sb_.build(1, "Open " + key(src_) + " with h = " + detail::fmt(h_score_[si]), overlay());
        }
        case Phase::Pop: {
          if (open_.empty()) {
            phase_ = Phase::Done;
            return sb_.build_final(12, "Open set exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          auto item = open_.pop();
          auto ui = static_cast<std::size_t>(item.node);
          if (closed_[ui]) {
            return sb_.build(5, "Pop " + key(item.node) + ": already closed", overlay());
          }
          closed_[ui] = 1;
          u_ = item.node;
          sb_.expand(u_);
          if (u_ == dst_) {
            phase_ = Phase::Found;
            return sb_.build(7, "Expand " + key(u_) + ": target reached", overlay());
          }
          cursor_ = adj_begin(u_);
          end_ = adj_end(u_);
          phase_ = Phase::Scan;
          return sb_.build(6, "Expand " + key(u_) + " (h = " + detail::fmt(h_score_[ui]) + ")", overlay());
        }
        case Phase::Scan: {
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            auto vi = static_cast<std::size_t>(v);
            if (closed_[vi] || discovered_[vi]) {
              sb_.ignore(e);
              return sb_.build(9, key(v) + " already " + (closed_[vi] ? "closed" : "discovered") + "; skip",
                               overlay());
            }
            discovered_[vi] = 1;
            h_score_[vi] = h(v);
            parent_[vi] = u_;
            via_[vi] = e;
            open_.push(h_score_[vi], v);
            sb_.discover(v);
            sb_.relax(e);
            return sb_.build(11, "Open " + key(v) + " with h = " + detail::fmt(h_score_[vi]), overlay());
          }
          phase_ = Phase::Pop;
          continue;
        }
        case Phase::Found: {
          phase_ = Phase::Done;
          auto [nodes, edges] = detail::trace_back(dst_, parent_, via_);
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "Path found: " + detail::join_path(*g_, nodes) + " with cost " + detail::fmt(r.path_cost) +
                            " (not necessarily optimal)";
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
      return !closed_[static_cast<std::size_t>(it.node)];
    });
    for (NodeId v = 0; v < g_->num_nodes(); ++v) {
      auto i = static_cast<std::size_t>(v);
      if (discovered_[i]) o.scores.push_back(ScoreRow{v, kInf, h_score_[i], h_score_[i]});
    }
    return o;
  }

  Phase phase_ {Phase::Init};
  std::vector<Weight> h_score_;
  std::vector<unsigned char> discovered_;
  std::vector<unsigned char> closed_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  detail::Frontier open_;
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_greedy_best_first(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "Greedy Best-First");
  return std::make_unique<GreedyBestFirst>(g, src, dst, opts);
}

std::span<const std::string_view> greedy_best_first_pseudocode() noexcept { return kGreedyPseudocode; }

} // namespace stepgraph::core
