/*
  Algorithm executables. Each factory returns a fresh producer; invoking it
  again with the same arguments yields an identical Step sequence.

  The graph must outlive the producer. Factories throw ConfigError when an
  endpoint is out of range or blocked, or when the graph carries negative
  weights and the algorithm forbids them.
*/
#pragma once

#include <span>
#include <string_view>

#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/options.hpp"
#include "stepgraph/core/step_producer.hpp"

namespace stepgraph::core {

[[nodiscard]] StepProducerPtr make_bfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_dfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_dijkstra(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_astar(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_greedy_best_first(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_bidirectional_bfs(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_bellman_ford(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});
[[nodiscard]] StepProducerPtr make_floyd_warshall(const Graph& g, NodeId src, NodeId dst, const SearchOptions& opts = {});

// Pseudocode listings indexed by Step::pseudocode_line.
[[nodiscard]] std::span<const std::string_view> bfs_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> dfs_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> dijkstra_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> astar_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> greedy_best_first_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> bidirectional_bfs_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> bellman_ford_pseudocode() noexcept;
[[nodiscard]] std::span<const std::string_view> floyd_warshall_pseudocode() noexcept;

} // namespace stepgraph::core
