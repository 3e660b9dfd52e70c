/* Step — immutable snapshot of one algorithmic event, plus its builder. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/types.hpp"

namespace stepgraph::core {

struct NodeChange {
  NodeId node;
  NodeState state;
  friend bool operator==(const NodeChange&, const NodeChange&) = default;
};

struct EdgeChange {
  EdgeId edge;
  EdgeState state;
  friend bool operator==(const EdgeChange&, const EdgeChange&) = default;
};

// Frontier entry as shown in the queue panel: node and its priority key
// (distance, f-score, h-score; 0 for FIFO/LIFO frontiers).
struct QueueEntry {
  NodeId node;
  Weight priority {0.0};
  friend bool operator==(const QueueEntry&, const QueueEntry&) = default;
};

struct ScoreRow {
  NodeId node;
  Weight g {kInf};
  Weight h {0.0};
  Weight f {kInf};
  friend bool operator==(const ScoreRow&, const ScoreRow&) = default;
};

// Algorithm-specific panel data. Fields an algorithm does not use stay empty.
struct Overlay {
  std::vector<QueueEntry> queue {};            // FIFO / priority frontier (forward)
  std::vector<QueueEntry> queue_backward {};   // bidirectional search only
  std::vector<NodeId> stack {};                // DFS
  std::vector<Weight> distances {};            // per NodeId, kInf when unknown
  std::vector<ScoreRow> scores {};             // A* / Greedy, ordered by NodeId
  std::vector<Weight> matrix {};               // Floyd-Warshall, row-major N*N
  std::optional<std::int32_t> round {};        // Bellman-Ford round or Floyd-Warshall k index
  std::optional<std::pair<NodeId, NodeId>> highlight_cell {};
  friend bool operator==(const Overlay&, const Overlay&) = default;
};

// Outcome payload, present on the terminal step only.
struct RunResult {
  std::optional<std::vector<NodeId>> path {};  // nullopt: unreachable or negative cycle
  std::vector<EdgeId> path_edges {};
  Weight path_cost {kInf};
  std::int64_t nodes_visited {0};
  std::int64_t edges_relaxed {0};
  bool negative_cycle {false};
  friend bool operator==(const RunResult&, const RunResult&) = default;
};

struct Step {
  std::int64_t step_number {0};
  std::optional<NodeId> current_node {};
  std::optional<EdgeId> current_edge {};
  // Classification events of this step; replaying 0..k yields the state at k.
  std::vector<NodeChange> node_changes {};
  std::vector<EdgeChange> edge_changes {};
  Overlay overlay {};
  std::int32_t pseudocode_line {0};
  std::string explanation {};
  std::optional<RunResult> result {};

  [[nodiscard]] bool is_final() const noexcept { return result.has_value(); }
  friend bool operator==(const Step&, const Step&) = default;
};

// Classification reconstructed by replaying step events in order.
class StateTable {
public:
  explicit StateTable(const Graph& g);

  void apply(const Step& step);
  [[nodiscard]] NodeState node(NodeId v) const { return nodes_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] EdgeState edge(EdgeId e) const { return edges_.at(static_cast<std::size_t>(e)); }
  [[nodiscard]] std::span<const NodeState> node_view() const noexcept { return nodes_; }
  [[nodiscard]] std::span<const EdgeState> edge_view() const noexcept { return edges_; }

private:
  std::vector<NodeState> nodes_;
  std::vector<EdgeState> edges_;
};

// Replay steps[0..k] (inclusive) from an empty table.
[[nodiscard]] StateTable replay(const Graph& g, std::span<const Step> steps, std::size_t k);

// StepBuilder is the single writer algorithms use to emit Steps. It keeps the
// running classification so that node events are only emitted on change, the
// previously expanded node is demoted to visited, and the visited/relaxed
// counters in the result payload equal the events present in the sequence.
class StepBuilder {
public:
  explicit StepBuilder(const Graph& g);

  // Initial classification: blocked nodes, source and target markers.
  void mark_endpoints(NodeId src, NodeId dst);

  void set_node(NodeId v, NodeState s);
  void expand(NodeId v);               // previous current -> visited, v -> current
  void visit(NodeId v);                // v -> visited
  void settle_current();               // current -> visited, no new current
  void discover(NodeId v);             // unvisited/source/target -> frontier
  void relax(EdgeId e);                // relaxing event (counted)
  void ignore(EdgeId e);               // examined without improvement
  void set_current_edge(std::optional<EdgeId> e) noexcept { current_edge_ = e; }
  void choose_path(std::span<const NodeId> nodes, std::span<const EdgeId> edges);

  [[nodiscard]] NodeState state(NodeId v) const { return nodes_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] std::optional<NodeId> current() const noexcept { return current_; }
  [[nodiscard]] std::int64_t nodes_visited() const noexcept { return nodes_visited_; }
  [[nodiscard]] std::int64_t edges_relaxed() const noexcept { return edges_relaxed_; }

  // Emit the pending events as a Step and clear them.
  [[nodiscard]] Step build(std::int32_t line, std::string explanation, Overlay overlay);
  // Emit the terminal Step; payload counters are filled in from this builder.
  [[nodiscard]] Step build_final(std::int32_t line, std::string explanation, Overlay overlay,
                                 RunResult result);

private:
  std::vector<NodeState> nodes_;
  std::vector<unsigned char> ever_visited_;
  std::vector<NodeChange> node_changes_;
  std::vector<EdgeChange> edge_changes_;
  std::optional<NodeId> current_ {};
  std::optional<EdgeId> current_edge_ {};
  std::int64_t next_number_ {0};
  std::int64_t nodes_visited_ {0};
  std::int64_t edges_relaxed_ {0};
};

} // namespace stepgraph::core
