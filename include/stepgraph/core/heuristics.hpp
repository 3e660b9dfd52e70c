/* Geometric heuristics for A* and Greedy Best-First. */
#pragma once

#include <string_view>

#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/types.hpp"

namespace stepgraph::core {

enum class Heuristic {
  Euclidean = 1,   // sqrt(dx^2 + dy^2)
  Manhattan = 2,   // |dx| + |dy|
  Octile = 3,      // max(|dx|,|dy|) + (sqrt(2)-1) * min(|dx|,|dy|)
  Zero = 4         // h = 0, A* degrades to Dijkstra
};

[[nodiscard]] Weight heuristic_distance(Heuristic h, const Point& a, const Point& b) noexcept;

// Estimate from v to target; 0 when either node has no position.
[[nodiscard]] Weight estimate(Heuristic h, const Graph& g, NodeId v, NodeId target);

[[nodiscard]] std::string_view to_string(Heuristic h) noexcept;
// Throws ConfigError for an unknown name.
[[nodiscard]] Heuristic parse_heuristic(std::string_view name);

} // namespace stepgraph::core
