/*
  Recorder — one algorithm run plus its metrics.

  Lifetime notes:
  - The graph is held through std::shared_ptr<const Graph>. The overload
    taking const Graph& creates a non-owning shared_ptr with a no-op
    deleter; the caller must then keep the graph alive for the run.
  - Metrics are folded lazily from the step events actually buffered, so
    partial runs (run_to) and playback driven through stepper() report the
    counts seen so far.
  - wall_time_ms covers run_to_completion() only; run_to() and stepper()
    playback are not timed.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/options.hpp"
#include "stepgraph/core/registry.hpp"
#include "stepgraph/core/step.hpp"
#include "stepgraph/core/stepper.hpp"

namespace stepgraph::core {

struct RunMetrics {
  std::string algorithm_key {};
  std::string algorithm_label {};
  std::string source {};
  std::string target {};
  std::string heuristic {};             // empty for algorithms without one
  std::int64_t nodes_visited {0};
  std::int64_t edges_relaxed {0};
  std::int64_t path_length {0};         // edges on the reported path
  Weight path_cost {kInf};
  std::int64_t total_steps {0};
  double wall_time_ms {0.0};
  std::int64_t peak_buffered_steps {0};
  bool path_found {false};
  bool negative_cycle {false};
  friend bool operator==(const RunMetrics&, const RunMetrics&) = default;
};

class Recorder {
public:
  explicit Recorder(const Registry& registry = default_registry());

  // Resolve the algorithm and endpoints and build a fresh Stepper. Throws
  // ConfigError for an unknown algorithm or node key, a blocked endpoint, a
  // negative weight the algorithm forbids, or invalid options.
  void start(std::string_view algorithm_key, std::string_view source, std::string_view target,
             std::shared_ptr<const Graph> graph, const SearchOptions& opts = {});
  void start(std::string_view algorithm_key, std::string_view source, std::string_view target,
             const Graph& graph, const SearchOptions& opts = {});

  // Drive the Stepper to the end. Only the pulling is timed. Throws
  // RuntimeError before start().
  const RunMetrics& run_to_completion();
  // Drive the Stepper to position n (or its end) and fold what was buffered.
  // Not timed.
  const RunMetrics& run_to(std::size_t position);

  [[nodiscard]] bool started() const noexcept { return stepper_.has_value(); }
  // Producer exhausted, however the stepper was driven.
  [[nodiscard]] bool completed() const noexcept { return stepper_.has_value() && stepper_->exhausted(); }

  // Throws RuntimeError before start().
  [[nodiscard]] Stepper& stepper();
  [[nodiscard]] const Stepper& stepper() const;
  [[nodiscard]] const Graph& graph() const;
  // Folds any steps buffered since the last call before returning.
  [[nodiscard]] const RunMetrics& metrics() const;
  // Terminal step once buffered, else nullptr.
  [[nodiscard]] const Step* final_step() const noexcept;
  [[nodiscard]] const std::optional<std::vector<NodeId>>& path() const;

private:
  void require_started(const char* op) const;
  void fold() const;

  const Registry* registry_;
  std::shared_ptr<const Graph> graph_ {};
  std::optional<Stepper> stepper_ {};
  // Folding state; updated from const accessors.
  mutable RunMetrics metrics_ {};
  mutable std::vector<unsigned char> ever_visited_ {};
  mutable std::size_t folded_ {0};
};

} // namespace stepgraph::core
