#include "stepgraph/core/heuristics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "stepgraph/core/error.hpp"
#include "stepgraph/core/options.hpp"

namespace stepgraph::core {

Weight heuristic_distance(Heuristic h, const Point& a, const Point& b) noexcept {
  const double dx = std::abs(a.x - b.x);
  const double dy = std::abs(a.y - b.y);
  switch (h) {
    case Heuristic::Euclidean: return std::sqrt(dx * dx + dy * dy);
    case Heuristic::Manhattan: return dx + dy;
    case Heuristic::Octile:    return std::max(dx, dy) + (std::sqrt(2.0) - 1.0) * std::min(dx, dy);
    case Heuristic::Zero:      return 0.0;
  }
  return 0.0;
}

Weight estimate(Heuristic h, const Graph& g, NodeId v, NodeId target) {
  const auto& pv = g.position(v);
  const auto& pt = g.position(target);
  if (!pv || !pt) return 0.0;
  return heuristic_distance(h, *pv, *pt);
}

std::string_view to_string(Heuristic h) noexcept {
  switch (h) {
    case Heuristic::Euclidean: return "euclidean";
    case Heuristic::Manhattan: return "manhattan";
    case Heuristic::Octile:    return "octile";
    case Heuristic::Zero:      return "zero";
  }
  return "unknown";
}

Heuristic parse_heuristic(std::string_view name) {
  for (auto h : {Heuristic::Euclidean, Heuristic::Manhattan, Heuristic::Octile, Heuristic::Zero}) {
    if (to_string(h) == name) return h;
  }
  throw ConfigError("unknown heuristic '" + std::string(name) + "'");
}

void validate(const SearchOptions& opts) {
  if (!std::isfinite(opts.heuristic_weight) || opts.heuristic_weight < 0.0) {
    throw ConfigError("heuristic_weight must be finite and >= 0");
  }
}

} // namespace stepgraph::core
