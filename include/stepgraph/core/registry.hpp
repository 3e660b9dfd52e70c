/*
  Algorithm registry — static key -> descriptor mapping.

  Adding an algorithm means adding one descriptor; nothing is discovered or
  loaded at runtime. Iteration order is registration order.
*/
#pragma once

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/heuristics.hpp"
#include "stepgraph/core/options.hpp"
#include "stepgraph/core/step_producer.hpp"

namespace stepgraph::core {

using ProducerFactory =
    std::function<StepProducerPtr(const Graph&, NodeId, NodeId, const SearchOptions&)>;

struct AlgorithmInfo {
  std::string key;
  std::string label;
  ProducerFactory factory;
  std::span<const std::string_view> pseudocode {};
  std::vector<std::string> tags {};
  std::string complexity_time {};
  std::string complexity_space {};
  bool supports_negative {false};
  bool is_all_pairs {false};
  // Heuristics the algorithm accepts; empty when it takes none.
  std::vector<Heuristic> heuristics {};
  std::string description {};

  [[nodiscard]] bool has_heuristic() const noexcept { return !heuristics.empty(); }
  [[nodiscard]] bool has_tag(std::string_view tag) const;
};

class Registry {
public:
  Registry() = default;

  // Throws ConfigError on an empty or duplicate key, or a missing factory.
  // References returned by get()/find()/list() are invalidated by add().
  void add(AlgorithmInfo info);

  // Throws ConfigError for an unknown key.
  [[nodiscard]] const AlgorithmInfo& get(std::string_view key) const;
  [[nodiscard]] const AlgorithmInfo* find(std::string_view key) const noexcept;
  [[nodiscard]] std::span<const AlgorithmInfo> list() const noexcept { return entries_; }
  [[nodiscard]] std::vector<const AlgorithmInfo*> by_tag(std::string_view tag) const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
  std::vector<AlgorithmInfo> entries_ {};
};

// The eight built-in algorithms, populated on first use.
[[nodiscard]] const Registry& default_registry();

} // namespace stepgraph::core
