#pragma once

#include <gtest/gtest.h>
#include <cmath>
#include <deque>
#include <string>
#include <vector>
#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/generators.hpp"
#include "stepgraph/core/graph.hpp"
#include "stepgraph/core/registry.hpp"
#include "stepgraph/core/step.hpp"

namespace stepgraph::core::test {

inline Graph make_graph(const std::vector<NodeSpec>& nodes, const std::vector<EdgeSpec>& edges,
                        bool directed = false) {
  return Graph::from_lists(nodes, edges, directed);
}

inline std::vector<NodeSpec> keys(std::initializer_list<const char*> names) {
  std::vector<NodeSpec> out;
  for (const auto* n : names) out.push_back(NodeSpec{n, std::nullopt, false});
  return out;
}

inline NodeId id(const Graph& g, const std::string& key) {
  auto v = g.find_node(key);
  EXPECT_TRUE(v.has_value()) << "no node " << key;
  return v.value_or(-1);
}

// Graph builders

inline Graph make_line_graph(int n, bool directed = false) {
  // "0" - "1" - ... - "n-1", unit weights
  std::vector<NodeSpec> nodes;
  std::vector<EdgeSpec> edges;
  for (int i = 0; i < n; ++i) nodes.push_back(NodeSpec{std::to_string(i), Point{double(i), 0.0}, false});
  for (int i = 0; i + 1 < n; ++i) edges.push_back(EdgeSpec{std::to_string(i), std::to_string(i + 1), 1.0});
  return Graph::from_lists(nodes, edges, directed);
}

inline Graph make_weighted_graph() {
  // Undirected six-node graph. Shortest A->E is A-C-F-E (cost 20); fewest
  // hops is A-F-E (cost 23).
  return make_graph(keys({"A", "B", "C", "D", "E", "F"}),
                    {{"A", "B", 7}, {"A", "C", 9}, {"A", "F", 14}, {"B", "C", 10}, {"B", "D", 15},
                     {"C", "D", 11}, {"C", "F", 2}, {"D", "E", 6}, {"E", "F", 9}});
}

inline Graph make_negative_dag() {
  // Directed; S->B->A->T (cost 4) beats S->A->T (cost 6) only through -3.
  return make_graph(keys({"S", "A", "B", "T"}),
                    {{"S", "A", 4}, {"S", "B", 5}, {"B", "A", -3}, {"A", "T", 2}}, true);
}

inline Graph make_negative_cycle_graph(bool reachable) {
  // Directed S->A->T plus a two-node cycle of total weight -2. The cycle is
  // entered from A when reachable, otherwise it is an island.
  std::vector<EdgeSpec> edges {{"S", "A", 1}, {"A", "T", 1}, {"X", "Y", 1}, {"Y", "X", -3}};
  if (reachable) edges.push_back({"A", "X", 1});
  return make_graph(keys({"S", "A", "T", "X", "Y"}), edges, true);
}

inline Graph make_open_grid(int rows, int cols) {
  GridGraphParams p;
  p.rows = rows;
  p.cols = cols;
  p.wall_probability = 0.0;
  return generate_grid(p, 1);
}

// Drivers

inline std::vector<Step> drain(StepProducer& producer, std::size_t limit = 1000000) {
  std::vector<Step> steps;
  while (steps.size() < limit) {
    auto s = producer.next();
    if (!s) break;
    steps.push_back(std::move(*s));
  }
  return steps;
}

inline std::vector<Step> run(const std::string& algorithm, const Graph& g, const std::string& src,
                             const std::string& dst, const SearchOptions& opts = {}) {
  auto producer = default_registry().get(algorithm).factory(g, id(g, src), id(g, dst), opts);
  return drain(*producer);
}

inline const RunResult& result_of(const std::vector<Step>& steps) {
  static const RunResult kEmpty {};
  if (steps.empty() || !steps.back().result) {
    ADD_FAILURE() << "sequence has no terminal step";
    return kEmpty;
  }
  return *steps.back().result;
}

// Temporaries (e.g. result_of(run(...))) return by value so the result
// outlives the step vector it was taken from.
inline RunResult result_of(std::vector<Step>&& steps) {
  return result_of(static_cast<const std::vector<Step>&>(steps));
}

// Reference shortest distance (Bellman-Ford, no negative cycles assumed).
inline Weight reference_distance(const Graph& g, NodeId src, NodeId dst, bool unit_weights = false) {
  std::vector<Weight> dist(static_cast<std::size_t>(g.num_nodes()), kInf);
  dist[static_cast<std::size_t>(src)] = 0.0;
  auto es = g.edge_src_view();
  auto ed = g.edge_dst_view();
  auto w = g.weight_view();
  for (int round = 0; round < g.num_nodes(); ++round) {
    for (std::size_t e = 0; e < w.size(); ++e) {
      if (g.blocked(es[e]) || g.blocked(ed[e])) continue;
      Weight we = unit_weights ? 1.0 : w[e];
      auto relax = [&](NodeId u, NodeId v) {
        auto ui = static_cast<std::size_t>(u);
        auto vi = static_cast<std::size_t>(v);
        if (dist[ui] != kInf && dist[ui] + we < dist[vi]) dist[vi] = dist[ui] + we;
      };
      relax(es[e], ed[e]);
      if (!g.directed()) relax(ed[e], es[e]);
    }
  }
  return dist[static_cast<std::size_t>(dst)];
}

// Assertion helpers

inline void expect_sequence_well_formed(const std::vector<Step>& steps) {
  ASSERT_FALSE(steps.empty());
  for (std::size_t i = 0; i < steps.size(); ++i) {
    EXPECT_EQ(steps[i].step_number, static_cast<std::int64_t>(i)) << "step numbers must be dense";
    EXPECT_EQ(steps[i].is_final(), i + 1 == steps.size()) << "only the last step is terminal, at " << i;
  }
}

inline void expect_path_valid(const Graph& g, const RunResult& r, NodeId src, NodeId dst) {
  ASSERT_TRUE(r.path.has_value());
  const auto& path = *r.path;
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(path.front(), src);
  EXPECT_EQ(path.back(), dst);
  ASSERT_EQ(r.path_edges.size() + 1, path.size());

  auto es = g.edge_src_view();
  auto ed = g.edge_dst_view();
  auto w = g.weight_view();
  Weight cost = 0.0;
  for (std::size_t i = 0; i < r.path_edges.size(); ++i) {
    auto e = static_cast<std::size_t>(r.path_edges[i]);
    ASSERT_LT(e, w.size());
    NodeId u = path[i];
    NodeId v = path[i + 1];
    bool forward = es[e] == u && ed[e] == v;
    bool backward = !g.directed() && es[e] == v && ed[e] == u;
    EXPECT_TRUE(forward || backward) << "edge " << e << " does not join " << u << " and " << v;
    EXPECT_FALSE(g.blocked(u)) << "path enters blocked node " << u;
    cost += w[e];
  }
  EXPECT_DOUBLE_EQ(r.path_cost, cost);
}

// Count the events the metrics are defined over.
inline std::int64_t count_relaxed_events(const std::vector<Step>& steps) {
  std::int64_t n = 0;
  for (const auto& s : steps)
    for (const auto& c : s.edge_changes)
      if (c.state == EdgeState::Relaxed) ++n;
  return n;
}

inline std::int64_t count_first_visits(const Graph& g, const std::vector<Step>& steps) {
  std::vector<bool> seen(static_cast<std::size_t>(g.num_nodes()), false);
  std::int64_t n = 0;
  for (const auto& s : steps)
    for (const auto& c : s.node_changes)
      if (c.state == NodeState::Visited && !seen[static_cast<std::size_t>(c.node)]) {
        seen[static_cast<std::size_t>(c.node)] = true;
        ++n;
      }
  return n;
}

} // namespace stepgraph::core::test
