/* Iterative depth-first search as a step producer. */
#include <array>
#include <memory>

#include "stepgraph/core/algorithms.hpp"
#include "search_common.hpp"

namespace stepgraph::core {

namespace {

constexpr std::array<std::string_view, 13> kDfsPseudocode = {
    "DFS(G, s, t):",
    "  S <- [(s, nil)]",
    "  while S is not empty:",
    "    (u, p) <- S.pop()",
    "    if u visited: continue",
    "    mark u visited; parent[u] <- p",
    "    if u = t: return path(t)",
    "    for each edge (u, v) in G.adj(u):",
    "      if v is blocked: continue",
    "      if v visited: skip (v)",
    "      else:",
    "        S.push((v, u))",
    "  return unreachable",
};

class Dfs final : public detail::SearchBase {
public:
  Dfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts)
      : SearchBase(g, src, dst, opts),
        visited_(static_cast<std::size_t>(g.num_nodes()), 0),
        parent_(static_cast<std::size_t>(g.num_nodes()), -1),
        via_(static_cast<std::size_t>(g.num_nodes()), -1) {}

  std::optional<Step> next() override {
    const auto col = g_->col_indices_view();
    const auto aei = g_->adj_edge_index_view();
    while (true) {
      switch (phase_) {
        case Phase::Init: {
          sb_.mark_endpoints(src_, dst_);
          stack_.push_back(Entry{src_, -1, -1});
          phase_ = Phase::Pop;
          return sb_.build(1, "Push " + key(src_) + " onto the stack", overlay());
        }
        case Phase::Pop: {
          if (stack_.empty()) {
            phase_ = Phase::Done;
            return sb_.build_final(12, "Stack exhausted; " + key(dst_) + " is unreachable from " + key(src_),
                                   overlay(), RunResult{});
          }
          Entry top = stack_.back();
          stack_.pop_back();
          auto ui = static_cast<std::size_t>(top.node);
          if (visited_[ui]) {
            return sb_.build(4, "Pop " + key(top.node) + ": already visited", overlay());
          }
          visited_[ui] = 1;
          parent_[ui] = top.parent;
          via_[ui] = top.via;
          u_ = top.node;
          sb_.expand(u_);
          if (u_ == dst_) {
            phase_ = Phase::Found;
            return sb_.build(6, "Pop " + key(u_) + ": it is the target", overlay());
          }
          cursor_ = adj_begin(u_);
          end_ = adj_end(u_);
          phase_ = Phase::Scan;
          return sb_.build(5, "Pop " + key(u_) + " and mark it visited", overlay());
        }
        case Phase::Scan: {
          while (cursor_ < end_) {
            NodeId v = col[cursor_];
            EdgeId e = aei[cursor_];
            ++cursor_;
            if (g_->blocked(v)) continue;
            if (visited_[static_cast<std::size_t>(v)]) {
              sb_.ignore(e);
              return sb_.build(9, key(v) + " already visited; skip", overlay());
            }
            stack_.push_back(Entry{v, u_, e});
            sb_.discover(v);
            sb_.relax(e);
            return sb_.build(11, "Push " + key(v) + " (reached from " + key(u_) + ")", overlay());
          }
          phase_ = Phase::Pop;
          continue;
        }
        case Phase::Found: {
          phase_ = Phase::Done;
          auto [nodes, edges] = detail::trace_back(dst_, parent_, via_);
          sb_.choose_path(nodes, edges);
          RunResult r = detail::path_result(*g_, nodes, edges);
          std::string msg = "Path found: " + detail::join_path(*g_, nodes);
          return sb_.build_final(6, std::move(msg), overlay(), std::move(r));
        }
        case Phase::Done:
          return std::nullopt;
      }
    }
  }

private:
  enum class Phase { Init, Pop, Scan, Found, Done };

  struct Entry {
    NodeId node;
    NodeId parent;
    EdgeId via;
  };

  [[nodiscard]] Overlay overlay() const {
    Overlay o;
    o.stack.reserve(stack_.size());
    for (const auto& en : stack_) o.stack.push_back(en.node);
    return o;
  }

  Phase phase_ {Phase::Init};
  std::vector<Entry> stack_ {};
  std::vector<unsigned char> visited_;
  std::vector<NodeId> parent_;
  std::vector<EdgeId> via_;
  NodeId u_ {-1};
  std::size_t cursor_ {0};
  std::size_t end_ {0};
};

} // namespace

StepProducerPtr make_dfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts) {
  detail::validate_request(g, src, dst, opts, false, "DFS");
  return std::make_unique<Dfs>(g, src, dst, opts);
}

std::span<const std::string_view> dfs_pseudocode() noexcept { return kDfsPseudocode; }

} // namespace stepgraph::core
