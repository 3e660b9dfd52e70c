/* Per-run search options. */
#pragma once

#include "stepgraph/core/heuristics.hpp"
#include "stepgraph/core/types.hpp"

namespace stepgraph::core {

// Options are read by the algorithms that understand them and ignored by the
// rest: heuristic fields by A* and Greedy Best-First, tie_break by every
// priority frontier (Dijkstra, A*, Greedy Best-First).
struct SearchOptions {
  Heuristic heuristic { Heuristic::Euclidean };
  // Multiplier applied to h. 1.0 keeps admissible heuristics admissible;
  // values above 1.0 trade optimality for fewer expansions.
  double heuristic_weight { 1.0 };
  TieBreak tie_break { TieBreak::InsertionOrder };
};

// Throws ConfigError on a non-finite or negative heuristic weight.
void validate(const SearchOptions& opts);

} // namespace stepgraph::core
