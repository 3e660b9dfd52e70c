#include "stepgraph/core/recorder.hpp"

#include <chrono>
#include <utility>

#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

namespace {
const std::optional<std::vector<NodeId>> kNoPath {};
}

Recorder::Recorder(const Registry& registry) : registry_(&registry) {}

void Recorder::start(std::string_view algorithm_key, std::string_view source, std::string_view target,
                     std::shared_ptr<const Graph> graph, const SearchOptions& opts) {
  if (!graph) throw ConfigError("Recorder::start: graph is null");
  const AlgorithmInfo& info = registry_->get(algorithm_key);
  auto src = graph->find_node(source);
  if (!src) throw ConfigError("unknown source node '" + std::string(source) + "'");
  auto dst = graph->find_node(target);
  if (!dst) throw ConfigError("unknown target node '" + std::string(target) + "'");

  // Build the producer before touching any state so a failed start leaves
  // the previous run intact.
  StepProducerPtr producer = info.factory(*graph, *src, *dst, opts);

  stepper_.reset();
  graph_ = std::move(graph);
  stepper_.emplace(std::move(producer));
  metrics_ = RunMetrics{};
  metrics_.algorithm_key = info.key;
  metrics_.algorithm_label = info.label;
  metrics_.source = std::string(source);
  metrics_.target = std::string(target);
  if (info.has_heuristic()) metrics_.heuristic = std::string(to_string(opts.heuristic));
  ever_visited_.assign(static_cast<std::size_t>(graph_->num_nodes()), 0);
  folded_ = 0;
}

void Recorder::start(std::string_view algorithm_key, std::string_view source, std::string_view target,
                     const Graph& graph, const SearchOptions& opts) {
  // Non-owning shared_ptr with no-op deleter; lifetime is managed by caller
  start(algorithm_key, source, target, std::shared_ptr<const Graph>(&graph, [](const Graph*) {}), opts);
}

const RunMetrics& Recorder::run_to_completion() {
  require_started("run_to_completion");
  auto t0 = std::chrono::steady_clock::now();
  stepper_->run_to_end();
  auto t1 = std::chrono::steady_clock::now();
  metrics_.wall_time_ms += std::chrono::duration<double, std::milli>(t1 - t0).count();
  fold();
  return metrics_;
}

const RunMetrics& Recorder::run_to(std::size_t position) {
  require_started("run_to");
  stepper_->seek(position);
  fold();
  return metrics_;
}

const RunMetrics& Recorder::metrics() const {
  if (stepper_) fold();
  return metrics_;
}

void Recorder::fold() const {
  const auto& history = stepper_->history();
  for (; folded_ < history.size(); ++folded_) {
    const Step& s = history[folded_];
    for (const auto& c : s.node_changes) {
      if (c.state != NodeState::Visited) continue;
      auto& seen = ever_visited_[static_cast<std::size_t>(c.node)];
      if (!seen) {
        seen = 1;
        ++metrics_.nodes_visited;
      }
    }
    for (const auto& c : s.edge_changes) {
      if (c.state == EdgeState::Relaxed) ++metrics_.edges_relaxed;
    }
    if (s.result) {
      const RunResult& r = *s.result;
      metrics_.path_found = r.path.has_value();
      metrics_.negative_cycle = r.negative_cycle;
      metrics_.path_cost = r.path_cost;
      metrics_.path_length = static_cast<std::int64_t>(r.path_edges.size());
    }
  }
  metrics_.total_steps = static_cast<std::int64_t>(history.size());
  // The buffer never shrinks, so its current size is the peak.
  metrics_.peak_buffered_steps = static_cast<std::int64_t>(history.size());
}

void Recorder::require_started(const char* op) const {
  if (!stepper_) throw RuntimeError(std::string("Recorder::") + op + " called before start()");
}

Stepper& Recorder::stepper() {
  require_started("stepper");
  return *stepper_;
}

const Stepper& Recorder::stepper() const {
  require_started("stepper");
  return *stepper_;
}

const Graph& Recorder::graph() const {
  require_started("graph");
  return *graph_;
}

const Step* Recorder::final_step() const noexcept {
  if (!stepper_ || stepper_->buffered() == 0) return nullptr;
  const Step& last = stepper_->history().back();
  return last.is_final() ? &last : nullptr;
}

const std::optional<std::vector<NodeId>>& Recorder::path() const {
  const Step* s = final_step();
  return s ? s->result->path : kNoPath;
}

} // namespace stepgraph::core
