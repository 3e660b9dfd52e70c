/*
  Step support — classification names, replay table and the StepBuilder.

  Node events are emitted only when the classification actually changes;
  edge events are emitted for every relaxing/ignoring event so repeated
  relaxations of the same edge (Bellman-Ford rounds) remain observable.
*/
#include "stepgraph/core/step.hpp"

#include <utility>

namespace stepgraph::core {

std::string_view to_string(NodeState s) noexcept {
  switch (s) {
    case NodeState::Unvisited: return "unvisited";
    case NodeState::Frontier:  return "frontier";
    case NodeState::Visited:   return "visited";
    case NodeState::Current:   return "current";
    case NodeState::OnPath:    return "path";
    case NodeState::Blocked:   return "blocked";
    case NodeState::Source:    return "source";
    case NodeState::Target:    return "target";
  }
  return "unknown";
}

std::string_view to_string(EdgeState s) noexcept {
  switch (s) {
    case EdgeState::Default: return "default";
    case EdgeState::Relaxed: return "relaxed";
    case EdgeState::Chosen:  return "chosen";
    case EdgeState::Ignored: return "ignored";
  }
  return "unknown";
}

StateTable::StateTable(const Graph& g)
    : nodes_(static_cast<std::size_t>(g.num_nodes()), NodeState::Unvisited),
      edges_(static_cast<std::size_t>(g.num_edges()), EdgeState::Default) {}

void StateTable::apply(const Step& step) {
  for (const auto& c : step.node_changes) nodes_.at(static_cast<std::size_t>(c.node)) = c.state;
  for (const auto& c : step.edge_changes) edges_.at(static_cast<std::size_t>(c.edge)) = c.state;
}

StateTable replay(const Graph& g, std::span<const Step> steps, std::size_t k) {
  StateTable table(g);
  for (std::size_t i = 0; i <= k && i < steps.size(); ++i) table.apply(steps[i]);
  return table;
}

StepBuilder::StepBuilder(const Graph& g)
    : nodes_(static_cast<std::size_t>(g.num_nodes()), NodeState::Unvisited),
      ever_visited_(static_cast<std::size_t>(g.num_nodes()), 0) {
  for (NodeId v = 0; v < g.num_nodes(); ++v) {
    if (g.blocked(v)) set_node(v, NodeState::Blocked);
  }
}

void StepBuilder::mark_endpoints(NodeId src, NodeId dst) {
  set_node(src, NodeState::Source);
  if (dst != src) set_node(dst, NodeState::Target);
}

void StepBuilder::set_node(NodeId v, NodeState s) {
  auto idx = static_cast<std::size_t>(v);
  if (nodes_.at(idx) == s) return;
  nodes_[idx] = s;
  node_changes_.push_back(NodeChange{v, s});
  if (s == NodeState::Visited && !ever_visited_[idx]) {
    ever_visited_[idx] = 1;
    ++nodes_visited_;
  }
}

void StepBuilder::expand(NodeId v) {
  if (current_ && *current_ != v) settle_current();
  set_node(v, NodeState::Current);
  current_ = v;
}

void StepBuilder::visit(NodeId v) { set_node(v, NodeState::Visited); }

void StepBuilder::settle_current() {
  if (current_ && state(*current_) == NodeState::Current) {
    set_node(*current_, NodeState::Visited);
  }
}

void StepBuilder::discover(NodeId v) {
  auto s = state(v);
  if (s == NodeState::Unvisited || s == NodeState::Source || s == NodeState::Target) {
    set_node(v, NodeState::Frontier);
  }
}

void StepBuilder::relax(EdgeId e) {
  edge_changes_.push_back(EdgeChange{e, EdgeState::Relaxed});
  current_edge_ = e;
  ++edges_relaxed_;
}

void StepBuilder::ignore(EdgeId e) {
  edge_changes_.push_back(EdgeChange{e, EdgeState::Ignored});
  current_edge_ = e;
}

void StepBuilder::choose_path(std::span<const NodeId> nodes, std::span<const EdgeId> edges) {
  settle_current();
  for (auto v : nodes) set_node(v, NodeState::OnPath);
  for (auto e : edges) edge_changes_.push_back(EdgeChange{e, EdgeState::Chosen});
}

Step StepBuilder::build(std::int32_t line, std::string explanation, Overlay overlay) {
  Step s;
  s.step_number = next_number_++;
  s.current_node = current_;
  s.current_edge = current_edge_;
  s.node_changes = std::move(node_changes_);
  s.edge_changes = std::move(edge_changes_);
  s.overlay = std::move(overlay);
  s.pseudocode_line = line;
  s.explanation = std::move(explanation);
  node_changes_.clear();
  edge_changes_.clear();
  current_edge_.reset();
  return s;
}

Step StepBuilder::build_final(std::int32_t line, std::string explanation, Overlay overlay,
                              RunResult result) {
  settle_current();
  result.nodes_visited = nodes_visited_;
  result.edges_relaxed = edges_relaxed_;
  Step s = build(line, std::move(explanation), std::move(overlay));
  s.result = std::move(result);
  return s;
}

} // namespace stepgraph::core
