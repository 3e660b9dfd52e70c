#include "stepgraph/core/comparator.hpp"

#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

namespace {
template <typename T>
Winner lower_wins(T a, T b) noexcept {
  if (a == b) return Winner::Tie;
  return a < b ? Winner::Left : Winner::Right;
}
} // namespace

ComparisonResult compare(const RunMetrics& left, const RunMetrics& right) {
  ComparisonResult r;
  r.left = left;
  r.right = right;
  r.nodes_visited = lower_wins(left.nodes_visited, right.nodes_visited);
  r.edges_relaxed = lower_wins(left.edges_relaxed, right.edges_relaxed);
  // +inf (no path) loses to any finite cost; two +inf costs tie.
  r.path_cost = lower_wins(left.path_cost, right.path_cost);
  r.wall_time = lower_wins(left.wall_time_ms, right.wall_time_ms);
  return r;
}

ComparisonResult compare(const Recorder& left, const Recorder& right) {
  if (!left.completed()) throw RuntimeError("compare: left run has not completed");
  if (!right.completed()) throw RuntimeError("compare: right run has not completed");
  return compare(left.metrics(), right.metrics());
}

std::string_view to_string(Winner w) noexcept {
  switch (w) {
    case Winner::Left:  return "left";
    case Winner::Right: return "right";
    case Winner::Tie:   return "tie";
  }
  return "unknown";
}

} // namespace stepgraph::core
