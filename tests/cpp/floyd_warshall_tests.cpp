#include <gtest/gtest.h>
#include "stepgraph/core/algorithms.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

TEST(FloydWarshall, MatrixConvergesToAllPairsDistances) {
  auto g = make_weighted_graph();
  auto steps = run("floyd_warshall", g, "A", "E");
  expect_sequence_well_formed(steps);
  const auto& m = steps.back().overlay.matrix;
  const auto n = static_cast<std::size_t>(g.num_nodes());
  ASSERT_EQ(m.size(), n * n);
  for (NodeId i = 0; i < g.num_nodes(); ++i) {
    for (NodeId j = 0; j < g.num_nodes(); ++j) {
      EXPECT_EQ(m[static_cast<std::size_t>(i) * n + static_cast<std::size_t>(j)], reference_distance(g, i, j))
          << g.node_key(i) << " -> " << g.node_key(j);
    }
  }
}

TEST(FloydWarshall, InitialMatrixUsesCheapestParallelEdge) {
  auto g = make_graph(keys({"a", "b"}), {{"a", "b", 5}, {"a", "b", 3}}, true);
  auto steps = run("floyd_warshall", g, "a", "b");
  const auto& m0 = steps.front().overlay.matrix;
  ASSERT_EQ(m0.size(), 4u);
  EXPECT_EQ(m0[0], 0.0);
  EXPECT_EQ(m0[1], 3.0);
  EXPECT_EQ(m0[2], kInf);
  EXPECT_EQ(m0[3], 0.0);
  const auto& r = result_of(steps);
  EXPECT_EQ(r.path_edges, std::vector<EdgeId>{1});
  EXPECT_DOUBLE_EQ(r.path_cost, 3.0);
}

TEST(FloydWarshall, UpdateStepsHighlightTheImprovedCell) {
  auto g = make_line_graph(3, true);
  auto steps = run("floyd_warshall", g, "0", "2");
  int updates = 0;
  for (const auto& s : steps) {
    if (s.is_final() || !s.overlay.highlight_cell) continue;
    ++updates;
    EXPECT_EQ(s.overlay.highlight_cell->first, 0);
    EXPECT_EQ(s.overlay.highlight_cell->second, 2);
    EXPECT_EQ(s.current_node, std::optional<NodeId>(1));
    EXPECT_EQ(s.edge_changes.size(), 2u);
  }
  // Only 0 -> 2 through k = 1 improves.
  EXPECT_EQ(updates, 1);
  // init + (start, end) for each k + one update + terminal
  EXPECT_EQ(steps.size(), 1u + 2u * 3u + 1u + 1u);
}

TEST(FloydWarshall, NegativeEdgesWithoutCycles) {
  auto g = make_negative_dag();
  const auto& r = result_of(run("floyd_warshall", g, "S", "T"));
  EXPECT_FALSE(r.negative_cycle);
  EXPECT_DOUBLE_EQ(r.path_cost, 4.0);
  expect_path_valid(g, r, id(g, "S"), id(g, "T"));
}

TEST(FloydWarshall, NegativeCycleAnywhereIsReported) {
  for (bool reachable : {true, false}) {
    SCOPED_TRACE(reachable);
    auto g = make_negative_cycle_graph(reachable);
    const auto& r = result_of(run("floyd_warshall", g, "S", "T"));
    EXPECT_TRUE(r.negative_cycle);
    EXPECT_FALSE(r.path.has_value());
  }
}

TEST(FloydWarshall, BlockedNodesTakeNoPart) {
  std::vector<NodeSpec> nodes {{"a", std::nullopt, false}, {"w", std::nullopt, true}, {"b", std::nullopt, false}};
  auto g = make_graph(nodes, {{"a", "w", 1}, {"w", "b", 1}});
  auto steps = run("floyd_warshall", g, "a", "b");
  EXPECT_FALSE(result_of(steps).path.has_value());
  for (const auto& s : steps) {
    if (s.overlay.round) EXPECT_NE(*s.overlay.round, 1);
  }
}
