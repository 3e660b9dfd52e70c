/* Breadth-first search as a step producer (unweighted shortest path). */
#include <array>
#include <deque>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 12> kBfsPseudocode = {
    "BFS(G, s, t):",
    "  mark s discovered; Q <- [s]",
    "  while Q is not empty:",
    "    u <- Q.dequeue()",
    "    if u = t: return path(t)",
    "    for each edge (u, v) in G.adj(u):",
    "      if v is blocked: continue",
    "      if v not discovered:",
    "        mark v discovered; parent[v] <- u",
    "        Q.enqueue(v)",
    "      else: skip (v)",
    "  return unreachable",
};

class Bfs final : public detail::SearchBase {
public:
  Bfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        discovered_(static_cast<std::size_t>(g.num_nodes()), 0),
        parent_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_(static_cast<std::size_t>(g.num_nodes()), -1) {}

  std::optional<Step> next() override {
    const auto col = g_->col_indices_view();
    const auto aei = g_->adj_edge_index_view();
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          discovered_[static_cast<std::size_t>(src_)] = 1;
          queue_.push_back(src_);
          phase_ = Phase::Dequeue;
          return sb_.build(1, "Start at " + key(src_) + "; enqueue it", overlay());
        }
        case Phase::Dequeue: {
          if (queue_.empty()) {
            phase_ = Phase::Done;
            return sb_.build_final(11, "Queue exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          u_ = queue_.front();
          queue_.pop_front();
          sb_.expand(u_);
          if (u_ == dst_) {
            phase_ = Phase::Found;
            return sb_.build(4, "Dequeue " + key(u_) + ": it is the target", overlay());
          }
          cursor_ = adj_begin(u_);
          end_ = adj_end(u_);
          phase_ = Phase::Scan;
          return sb_.build(3, "Dequeue " + key(u_) + " and scan its neighbours", overlay());
        }
        case Phase::Scan: {
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            auto vi = static_cast<std::size_t>(v);
            if (!discovered_[vi]) {
              discovered_[vi] = 1;
              parent_[vi] = u_;
              via_[vi] = e;
              queue_.push_back(v);
              sb_.discover(v);
              sb_.relax(e);
              return sb_.build(9, "Discover " + key(v) + " from " + key(u_) + "; enqueue it", overlay());
            }
            sb_.ignore(e);
            return sb_.build(10, key(v) + " already discovered; skip", overlay());
          }
          phase_ = Phase::Dequeue;
          continue;
        }
        case Phase::Found: {
          phase_ = Phase::Done;
          auto [nodes, edges] = detail::trace_back(dst_, parent_, via_);
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "Path found: " + detail::join_path(*g_, nodes) + " (" +
                            std::to_string(edges.size()) + " edges)";
          return sb_.build_final(4, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, Dequeue, Scan, Found, Done };

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.queue.reserve(queue_.size());
    for (auto v : queue_) o.queue.push_back(QueueEntry{v, 0.0});
    return o;
  }

  Phase phase_ {Phase::Init};
  std::deque<NodeId> queue_ {};
  std::vector<unsigned char> discovered_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_bfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "BFS");
  return std::make_unique<Bfs>(g, src, dst, opts);
}

std::span<const std::string_view> bfs_pseudocode() noexcept { return kBfsPseudocode; }

} // namespace stepgraph::core
