/*
  dijkstra — single-pair Dijkstra as a step producer.

  Features:
    - Lazy-deletion frontier; superseded entries are popped as stale steps.
    - Deterministic ties (insertion order or lowest node id).
    - Early exit when the target is settled.
*/
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 15> kDijkstraPseudocode = {
    "Dijkstra(G, s, t):",
    "  for each v: dist[v] <- inf",
    "  dist[s] <- 0",
    "  PQ <- {(0, s)}",
    "  while PQ is not empty:",
    "    (d, u) <- PQ.extract_min()",
    "    if u settled or d > dist[u]: continue",
    "    settle u; if u = t: return path(t)",
    "    for each edge (u, v, w) in G.adj(u):",
    "      if v is settled: skip (v)",
    "      alt <- dist[u] + w",
    "      if alt >= dist[v]: skip (v)",
    "      dist[v] <- alt; parent[v] <- u",
    "      PQ.insert((alt, v))",
    "  return unreachable",
};

class Dijkstra final : public detail::SearchBase {
public:
  Dijkstra(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        dist_(static_cast<std::size_t>(g.num_nodes()), kInf),
        settled_(static_cast<std::size_t>(g.num_nodes()), 0),
        parent_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_(static_cast<std::size_t>(g.num_nodes()), -1),
        pq_(opts.tie_break) {}

  std::optional<Step> next() override {
    const auto col = g_->col_indices_view();
    const auto aei = g_->adj_edge_index_view();
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          dist_[static_cast<std::size_t>(src_)] = 0.0;
          pq_.push(0.0, src_);
          phase_ = Phase::Pop;
          return sb_.build(2, "dist[" + g_->node_key(src_) + "] = 0; all others inf", overlay());
        }
        case Phase::Pop: {
          if (pq_.empty()) {
            phase_ = Phase::Done;
            return sb_.build_final(14, "Queue exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          auto item = pq_.pop();
          auto ui = static_cast<std::size_t>(item.node);
          if (settled_[ui] || item.key > dist_[ui]) {
            return sb_.build(6, "Pop stale entry " + key(item.node) + " (" + detail::fmt(item.key) + ")",
                             overlay());
          }
          settled_[ui] = 1;
          u_ = item.node;
          sb_.expand(u_);
          if (u_ == dst_) {
            phase_ = Phase::Found;
            return sb_.build(7, "Settle " + key(u_) + " at distance " + detail::fmt(dist_[ui]) + ": target reached",
                             overlay());
          }
          cursor_ = adj_begin(u_);
          end_ = adj_end(u_);
          phase_ = Phase::Scan;
          return sb_.build(7, "Settle " + key(u_) + " at distance " + detail::fmt(dist_[ui]), overlay());
        }
        case Phase::Scan: {
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            auto vi = static_cast<std::size_t>(v);
            if (settled_[vi]) {
              sb_.ignore(e);
              return sb_.build(9, key(v) + " already settled; skip", overlay());
            }
            Weight alt = dist_[static_cast<std::size_t>(u_)] + weight(e);
            if (alt < dist_[vi]) {
              dist_[vi] = alt;
              parent_[vi] = u_;
              via_[vi] = e;
              pq_.push(alt, v);
              sb_.discover(v);
              sb_.relax(e);
              return sb_.build(12, "Relax " + key(u_) + " -> " + key(v) + ": dist = " + detail::fmt(alt), overlay());
            }
            sb_.ignore(e);
            return sb_.build(11, "No improvement for " + key(v) + " (" + detail::fmt(alt) + " >= " +
                                     detail::fmt(dist_[vi]) + ")",
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
          std::string msg = "Shortest path " + detail::join_path(*g_, nodes) + " with cost " + detail::fmt(r.path_cost);
          return sb_.build_final(7, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, Pop, Scan, Found, Done };

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.queue = pq_.snapshot([this](const detail::Frontier::Item& it) {
      auto i = static_cast<std::size_t>(it.node);
      return !settled_[i] && it.key <= dist_[i];
    });
    o.distances = dist_;
    return o;
  }

  Phase phase_ {Phase::Init};
  std::vector<Weight> dist_;
  std::vector<unsigned char> settled_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  detail::Frontier pq_;
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_dijkstra(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "Dijkstra");
  return std::make_unique<Dijkstra>(g, src, dst, opts);
}

std::span<const std::string_view> dijkstra_pseudocode() noexcept { return kDijkstraPseudocode; }

} // namespace stepgraph::core
