/*
  bidirectional_bfs — breadth-first search from both endpoints.

  The forward search follows outgoing edges from the source, the backward
  search follows incoming edges from the target. Whole layers alternate,
  forward first. The run stops as soon as one side discovers a node the
  other side has already discovered; on an unweighted graph the stitched
  path through that meeting node is a shortest one.
*/
#include <array>
#include <deque>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 14> kBidirectionalPseudocode = {
    "BidirectionalBFS(G, s, t):",
    "  QF <- [s]; QB <- [t]; seenF <- {s}; seenB <- {t}",
    "  if s = t: return [s]",
    "  while QF and QB are not empty:",
    "    for each u in the current forward layer:",
    "      for each edge (u, v) in G.out(u):",
    "        if v in seenF: skip (v)",
    "        seenF <- seenF + {v}; parentF[v] <- u; QF.enqueue(v)",
    "        if v in seenB: return join(v)",
    "    for each u in the current backward layer:",
    "      for each edge (v, u) in G.in(u):",
    "        if v in seenB: skip (v)",
    "        seenB <- seenB + {v}; parentB[v] <- u; QB.enqueue(v)",
    "  return unreachable",
};

enum class Side { Forward, Backward };

class BidirectionalBfs final : public detail::SearchBase {
public:
  BidirectionalBfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        seen_f_(static_cast<std::size_t>(g.num_nodes()), 0),
        seen_b_(static_cast<std::size_t>(g.num_nodes()), 0),
        parent_f_(static_cast<std::size_t>(g.num_nodes()), -1),
        parent_b_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_f_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_b_(static_cast<std::size_t>(g.num_nodes()), -1) {}

  std::optional<Step> next() override {
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          seen_f_[static_cast<std::size_t>(src_)] = 1;
          seen_b_[static_cast<std::size_t>(dst_)] = 1;
          queue_f_.push_back(src_);
          queue_b_.push_back(dst_);
          if (src_ == dst_) {
            meeting_ = src_;
            phase_ = Phase::Met;
            return sb_.build(2, "Source and target coincide", overlay());
          }
          phase_ = Phase::Expand;
          return sb_.build(1, "Start forward search at " + key(src_) + " and backward search at " + key(dst_),
                           overlay());
        }
        case Phase::Expand: {
          if (layer_remaining_ == 0) {
            if (queue_f_.empty() || queue_b_.empty()) {
              phase_ = Phase::Done;
              return sb_.build_final(13, "A frontier is exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                     overlay(), RunResult{});
            }
            side_ = started_ && side_ == Side::Forward ? Side::Backward : Side::Forward;
            started_ = true;
            layer_remaining_ = queue(side_).size();
          }
          u_ = queue(side_).front();
          queue(side_).pop_front();
          --layer_remaining_;
          sb_.expand(u_);
          const bool fwd = side_ == Side::Forward;
          const auto row = fwd ? g_->row_offsets_view() : g_->in_row_offsets_view();
          cursor_ = static_cast<std::size_t>(row[static_cast<std::size_t>(u_)]);
          end_ = static_cast<std::size_t>(row[static_cast<std::size_t>(u_) + 1]);
          phase_ = Phase::Scan;
          return sb_.build(fwd ? 4 : 9, std::string(fwd ? "Forward" : "Backward") + ": expand " + key(u_),
                           overlay());
        }
        case Phase::Scan: {
          const bool fwd = side_ == Side::Forward;
          const auto col = fwd ? g_->col_indices_view() : g_->in_col_indices_view();
          const auto aei = fwd ? g_->adj_edge_index_view() : g_->in_adj_edge_index_view();
          auto& seen = fwd ? seen_f_ : seen_b_;
          const auto& other = fwd ? seen_b_ : seen_f_;
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            auto vi = static_cast<std::size_t>(v);
            if (seen[vi]) {
              sb_.ignore(e);
              return sb_.build(fwd ? 6 : 11, key(v) + " already seen from this side; skip", overlay());
            }
            seen[vi] = 1;
            (fwd ? parent_f_ : parent_b_)[vi] = u_;
            (fwd ? via_f_ : via_b_)[vi] = e;
            queue(side_).push_back(v);
            sb_.discover(v);
            sb_.relax(e);
            if (other[vi]) {
              meeting_ = v;
              phase_ = Phase::Met;
              return sb_.build(8, "Frontiers meet at " + key(v), overlay());
            }
            return sb_.build(fwd ? 7 : 12,
                             std::string(fwd ? "Forward" : "Backward") + ": discover " + key(v) + " from " + key(u_),
                             overlay());
          }
          phase_ = Phase::Expand;
          continue;
        }
        case Phase::Met: {
          phase_ = Phase::Done;
          auto [nodes, edges] = stitch();
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "Path found through " + key(meeting_) + ": " + detail::join_path(*g_, nodes);
          return sb_.build_final(8, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, Expand, Scan, Met, Done };

  std::deque<NodeId>& queue(Side s) { return s == Side::Forward ? queue_f_ : queue_b_; }

  // Forward chain source..meeting, then backward links meeting..target.
  [[nodiscard]] std::pair<std::vector<NodeId>, std::vector<EdgeId>> stitch() const {
    auto [nodes, edges] = detail::trace_back(meeting_, parent_f_, via_f_);
    NodeId cur = meeting_;
    std::size_t guard = parent_b_.size();
    while (parent_b_[static_cast<std::size_t>(cur)] >= 0 && guard-- > 0) {
      edges.push_back(via_b_[static_cast<std::size_t>(cur)]);
      cur = parent_b_[static_cast<std::size_t>(cur)];
      nodes.push_back(cur);
    }
    return {std::move(nodes), std::move(edges)};
  }

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    for (auto v : queue_f_) o.queue.push_back(QueueEntry{v, 0.0});
    for (auto v : queue_b_) o.queue_backward.push_back(QueueEntry{v, 0.0});
    return o;
  }

  Phase phase_ {Phase::Init};
  Side side_ {Side::Forward};
  bool started_ {false};
  std::size_t layer_remaining_ {0};
  std::deque<NodeId> queue_f_ {};
  std::deque<NodeId> queue_b_ {};
  std::vector<unsigned char> seen_f_;
  std::vector<unsigned char> seen_b_;
  std::vector<NodeId> parent_f_;
  std::vector<NodeId> parent_b_;
  std::vector<EdgeId> via_f_;
  std::vector<EdgeId> via_b_;
  NodeId meeting_ {-1};
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_bidirectional_bfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "Bidirectional BFS");
  return std::make_unique<BidirectionalBfs>(g, src, dst, opts);
}

std::span<const std::string_view> bidirectional_bfs_pseudocode() noexcept { return kBidirectionalPseudocode; }

} // namespace stepgraph::core
