/*
  floyd_warshall — all-pairs dynamic programme as a step producer.

  Every intermediate node k opens and closes a round; inside a round a
  step is emitted only for cells (i, j) that improve. Cells with i = j are
  included so that a negative cycle shows up as a negative diagonal entry.
  The requested pair is answered from the next-hop matrix at the end.
*/
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 12> kFloydWarshallPseudocode = {
    "FloydWarshall(G, s, t):",
    "  D[i][j] <- w(i, j) or inf; D[i][i] <- 0; next[i][j] <- j",
    "  for k <- 1 to |V|:",
    "    begin round k",
    "    for i <- 1 to |V|:",
    "      for j <- 1 to |V|:",
    "        if D[i][k] + D[k][j] >= D[i][j]: continue",
    "        D[i][j] <- D[i][k] + D[k][j]",
    "        next[i][j] <- next[i][k]",
    "  if D[i][i] < 0 for some i: return negative cycle",
    "  if D[s][t] = inf: return unreachable",
    "  return path via next[s][t]",
};

class FloydWarshall final : public detail::SearchBase {
public:
  FloydWarshall(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        n_(static_cast<std::size_t>(g.num_nodes())),
        dist_(n_ * n_, kInf),
        next_hop_(n_ * n_, -1) {}

  std::optional<Step> next() override {
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          initialise();
          phase_ = Phase::RoundStart;
          return sb_.build(1, "Initialise the " + std::to_string(n_) + "x" + std::to_string(n_) +
                                  " distance matrix from direct edges",
                           overlay());
        }
        case Phase::RoundStart: {
          while (k_ < n_ && g_->blocked(static_cast<NodeId>(k_))) ++k_;
          if (k_ == n_) {
            phase_ = Phase::Answer;
            continue;
          }
          i_ = 0;
          j_ = 0;
          updates_ = 0;
          in_round_ = true;
          sb_.expand(static_cast<NodeId>(k_));
          phase_ = Phase::Cells;
          return sb_.build(3, "Round k = " + key(static_cast<NodeId>(k_)) + ": try it as an intermediate node",
                           overlay());
        }
        case Phase::Cells: {
          const NodeId k = static_cast<NodeId>(k_);
          for (; i_ < n_; ++i_, j_ = 0) {
            const Weight dik = at(i_, k_);
            if (dik == kInf) continue;
            for (; j_ < n_; ++j_) {
              const Weight dkj = at(k_, j_);
              if (dkj == kInf) continue;
              const Weight alt = dik + dkj;
              if (!(alt < at(i_, j_))) continue;
              const std::size_t i = i_;
              const std::size_t j = j_++;
              const Weight old = at(i, j);
              at(i, j) = alt;
              next_hop_[i * n_ + j] = next_hop_[i * n_ + k_];
              ++updates_;
              const NodeId ni = static_cast<NodeId>(i);
              const NodeId nj = static_cast<NodeId>(j);
              if (ni != k) {
                if (auto e = g_->find_edge(ni, k)) sb_.relax(*e);
              }
              if (nj != k) {
                if (auto e = g_->find_edge(k, nj)) sb_.relax(*e);
              }
              Overlay o = overlay();
              o.highlight_cell = std::make_pair(ni, nj);
              return sb_.build(7, "D[" + g_->node_key(ni) + "][" + g_->node_key(nj) + "]: " + detail::fmt(old) +
                                      " -> " + detail::fmt(alt) + " via " + key(k),
                               std::move(o));
            }
          }
          phase_ = Phase::RoundEnd;
          continue;
        }
        case Phase::RoundEnd: {
          sb_.settle_current();
          std::string msg = "Round k = " + key(static_cast<NodeId>(k_)) + " complete: " + std::to_string(updates_) +
                            " update" + (updates_ == 1 ? "" : "s");
          Step step = sb_.build(3, std::move(msg), overlay());
          ++k_;
          in_round_ = false;
          phase_ = Phase::RoundStart;
          return step;
        }
        case Phase::Answer: {
          phase_ = Phase::Done;
          for (std::size_t i = 0; i < n_; ++i) {
            if (at(i, i) < 0.0) {
              RunResult r;
              r.negative_cycle = true;
              Overlay o = overlay();
              o.highlight_cell = std::make_pair(static_cast<NodeId>(i), static_cast<NodeId>(i));
              return sb_.build_final(9, "Negative cycle: D[" + g_->node_key(static_cast<NodeId>(i)) + "][" +
                                            g_->node_key(static_cast<NodeId>(i)) + "] = " + detail::fmt(at(i, i)),
                                     std::move(o), std::move(r));
            }
          }
          const auto s = static_cast<std::size_t>(src_);
          const auto t = static_cast<std::size_t>(dst_);
          if (at(s, t) == kInf) {
            return sb_.build_final(10, key(dst_) + " is unreachable from " + key(src_), overlay(), RunResult{});
          }
          std::vector<NodeId> nodes {src_};
          std::vector<EdgeId> edges;
          std::size_t cur = s;
          std::size_t guard = n_;
          while (cur != t && guard-- > 0) {
            const NodeId hop = next_hop_[cur * n_ + t];
            if (hop < 0) break;
            const auto nxt = static_cast<std::size_t>(hop);
            auto e = g_->find_edge(static_cast<NodeId>(cur), static_cast<NodeId>(nxt));
            if (e) edges.push_back(*e);
            nodes.push_back(static_cast<NodeId>(nxt));
            cur = nxt;
          }
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          Overlay o = overlay();
          o.highlight_cell = std::make_pair(src_, dst_);
          std::string msg = "Shortest path " + detail::join_path(*g_, nodes) + " with cost " + detail::fmt(r.path_cost);
          return sb_.build_final(11, std::move(msg), std::move(o), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, RoundStart, Cells, RoundEnd, Answer, Done };

  [[nodiscard]] Weight& at(std::size_t i, std::size_t j) { return dist_[i * n_ + j]; }
  [[nodiscard]] Weight at(std::size_t i, std::size_t j) const { return dist_[i * n_ + j]; }

  void initialise() {
    for (std::size_t i = 0; i < n_; ++i) {
      if (g_->blocked(static_cast<NodeId>(i))) continue;
      at(i, i) = 0.0;
      next_hop_[i * n_ + i] = static_cast<NodeId>(i);
    }
    const auto es = g_->edge_src_view();
    const auto ed = g_->edge_dst_view();
    const auto w = g_->weight_view();
    auto offer = [&](NodeId u, NodeId v, Weight wt) {
      auto ui = static_cast<std::size_t>(u);
      auto vi = static_cast<std::size_t>(v);
      if (wt < at(ui, vi)) {
        at(ui, vi) = wt;
        next_hop_[ui * n_ + vi] = v;
      }
    };
    for (std::size_t e = 0; e < w.size(); ++e) {
      NodeId u = es[e];
      NodeId v = ed[e];
      if (g_->blocked(u) || g_->blocked(v)) continue;
      offer(u, v, w[e]);
      if (!g_->directed()) offer(v, u, w[e]);
    }
  }

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.matrix = dist_;
    if (in_round_) o.round = static_cast<std::int32_t>(k_);
    return o;
  }

  std::size_t n_;
  Phase phase_ {Phase::Init};
  std::vector<Weight> dist_;
  std::vector<NodeId> next_hop_;
  std::size_t k_ {0};
  std::size_t i_ {0};
  std::size_t j_ {0};
  std::int64_t updates_ {0};
  bool in_round_ {false};
};

} // namespace

StepProducerPtr make_floyd_warshall(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, true, "Floyd-Warshall");
  return std::make_unique<FloydWarshall>(g, src, dst, opts);
}

std::span<const std::string_view> floyd_warshall_pseudocode() noexcept { return kFloydWarshallPseudocode; }

} // namespace stepgraph::core
