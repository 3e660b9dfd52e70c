#include "stepgraph/core/registry.hpp"

#include <algorithm>
#include <utility>

#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

bool AlgorithmInfo::has_tag(std::string_view tag) const {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

void Registry::add(AlgorithmInfo info) {
  if (info.key.empty()) throw ConfigError("algorithm key must be non-empty");
  if (!info.factory) throw ConfigError("algorithm '" + info.key + "' has no factory");
  if (find(info.key) != nullptr) throw ConfigError("duplicate algorithm key '" + info.key + "'");
  entries_.push_back(std::move(info));
}

const AlgorithmInfo& Registry::get(std::string_view key) const {
  if (const auto* info = find(key)) return *info;
  throw ConfigError("unknown algorithm '" + std::string(key) + "'");
}

const AlgorithmInfo* Registry::find(std::string_view key) const noexcept {
  for (const auto& info : entries_) {
    if (info.key == key) return &info;
  }
  return nullptr;
}

std::vector<const AlgorithmInfo*> Registry::by_tag(std::string_view tag) const {
  std::vector<const AlgorithmInfo*> out;
  for (const auto& info : entries_) {
    if (info.has_tag(tag)) out.push_back(&info);
  }
  return out;
}

namespace {

Registry build_default_registry() {
  const std::vector<Heuristic> all_heuristics {Heuristic::Euclidean, Heuristic::Manhattan,
                                               Heuristic::Octile, Heuristic::Zero};
  Registry r;
  r.add({"bfs", "Breadth-First Search", make_bfs, bfs_pseudocode(),
         {"unweighted", "shortest-path", "traversal"}, "O(V + E)", "O(V)", false, false, {},
         "Explores layer by layer. Finds the shortest path by hop count."});
  r.add({"dfs", "Depth-First Search", make_dfs, dfs_pseudocode(),
         {"unweighted", "traversal"}, "O(V + E)", "O(V)", false, false, {},
         "Dives deep before backtracking. Does not guarantee a shortest path."});
  r.add({"dijkstra", "Dijkstra's Algorithm", make_dijkstra, dijkstra_pseudocode(),
         {"weighted", "shortest-path"}, "O((V + E) log V)", "O(V)", false, false, {},
         "Expands the closest unsettled node. Optimal for non-negative weights."});
  r.add({"astar", "A* Search", make_astar, astar_pseudocode(),
         {"weighted", "shortest-path", "heuristic"}, "O((V + E) log V)", "O(V)", false, false, all_heuristics,
         "Dijkstra guided by a heuristic. Optimal when the heuristic is admissible."});
  r.add({"bidirectional_bfs", "Bidirectional BFS", make_bidirectional_bfs, bidirectional_bfs_pseudocode(),
         {"unweighted", "shortest-path", "bidirectional"}, "O(b^(d/2))", "O(b^(d/2))", false, false, {},
         "Two frontiers grow from source and target and meet in the middle."});
  r.add({"bellman_ford", "Bellman-Ford", make_bellman_ford, bellman_ford_pseudocode(),
         {"weighted", "shortest-path", "negative-edges"}, "O(V * E)", "O(V)", true, false, {},
         "Handles negative edges and detects negative cycles. Slower than Dijkstra."});
  r.add({"floyd_warshall", "Floyd-Warshall", make_floyd_warshall, floyd_warshall_pseudocode(),
         {"weighted", "all-pairs", "negative-edges"}, "O(V^3)", "O(V^2)", true, true, {},
         "All-pairs shortest paths by dynamic programming over intermediate nodes."});
  r.add({"greedy_bfs", "Greedy Best-First", make_greedy_best_first, greedy_best_first_pseudocode(),
         {"heuristic", "suboptimal"}, "O((V + E) log V)", "O(V)", false, false, all_heuristics,
         "Follows the heuristic alone. Fast but not optimal."});
  return r;
}

} // namespace

const Registry& default_registry() {
  static const Registry registry = build_default_registry();
  return registry;
}

} // namespace stepgraph::core
