/*
  Comparator — side-by-side verdicts for two completed runs.

  For each metric lower is better and exact equality is a tie. The caller
  is responsible for running both recorders on equivalent graphs; the
  comparison does not check graph identity.
*/
#pragma once

#include <string_view>

#include "stepgraph/core/recorder.hpp"

namespace stepgraph::core {

enum class Winner { Left = 1, Right = 2, Tie = 3 };

struct ComparisonResult {
  RunMetrics left {};
  RunMetrics right {};
  Winner nodes_visited {Winner::Tie};
  Winner edges_relaxed {Winner::Tie};
  Winner path_cost {Winner::Tie};
  Winner wall_time {Winner::Tie};
  friend bool operator==(const ComparisonResult&, const ComparisonResult&) = default;
};

[[nodiscard]] ComparisonResult compare(const RunMetrics& left, const RunMetrics& right);
// Throws RuntimeError unless both recorders have completed their runs.
[[nodiscard]] ComparisonResult compare(const Recorder& left, const Recorder& right);

[[nodiscard]] std::string_view to_string(Winner w) noexcept;

} // namespace stepgraph::core
