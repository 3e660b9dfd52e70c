#include <gtest/gtest.h>
#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/registry.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

namespace {
const char* const kWeightedOptimal[] = {"dijkstra", "astar", "bellman_ford", "floyd_warshall"};
const char* const kHopOptimal[] = {"bfs", "bidirectional_bfs"};
} // namespace

TEST(ShortestPaths, WeightedGraphCosts) {
  auto g = make_weighted_graph();
  for (const char* key : kWeightedOptimal) {
    SCOPED_TRACE(key);
    auto steps = run(key, g, "A", "E");
    const auto& r = result_of(steps);
    EXPECT_DOUBLE_EQ(r.path_cost, 20.0);
    std::vector<NodeId> expected {id(g, "A"), id(g, "C"), id(g, "F"), id(g, "E")};
    EXPECT_EQ(*r.path, expected);
  }
}

TEST(ShortestPaths, HopCountSearchesFindFewestEdges) {
  auto g = make_weighted_graph();
  for (const char* key : kHopOptimal) {
    SCOPED_TRACE(key);
    const auto& r = result_of(run(key, g, "A", "E"));
    ASSERT_TRUE(r.path.has_value());
    EXPECT_EQ(r.path->size(), 3u);
    expect_path_valid(g, r, id(g, "A"), id(g, "E"));
  }
}

TEST(ShortestPaths, OptimalOnRandomGraphs) {
  for (std::uint32_t seed = 1; seed <= 8; ++seed) {
    RandomGraphParams p;
    p.num_nodes = 14;
    p.edge_probability = 0.2;
    p.directed = seed % 2 == 0;
    auto g = generate_random(p, seed);
    const NodeId src = 0;
    const NodeId dst = 13;
    const Weight best = reference_distance(g, src, dst);
    const Weight hops = reference_distance(g, src, dst, true);
    SCOPED_TRACE(seed);

    SearchOptions zero;
    zero.heuristic = Heuristic::Zero;
    for (const char* key : kWeightedOptimal) {
      SCOPED_TRACE(key);
      auto steps = run(key, g, "0", "13", zero);
      const auto& r = result_of(steps);
      EXPECT_EQ(r.path_cost, best);
      if (best < kInf) expect_path_valid(g, r, src, dst);
    }
    for (const char* key : kHopOptimal) {
      SCOPED_TRACE(key);
      const auto& r = result_of(run(key, g, "0", "13"));
      if (hops == kInf) {
        EXPECT_FALSE(r.path.has_value());
      } else {
        ASSERT_TRUE(r.path.has_value());
        EXPECT_EQ(static_cast<Weight>(r.path_edges.size()), hops);
      }
    }
  }
}

TEST(ShortestPaths, AStarZeroHeuristicMatchesDijkstra) {
  for (std::uint32_t seed = 20; seed < 26; ++seed) {
    RandomGraphParams p;
    p.num_nodes = 16;
    p.edge_probability = 0.25;
    auto g = generate_random(p, seed);
    SearchOptions zero;
    zero.heuristic = Heuristic::Zero;
    SCOPED_TRACE(seed);
    EXPECT_EQ(result_of(run("astar", g, "0", "15", zero)).path_cost,
              result_of(run("dijkstra", g, "0", "15")).path_cost);
  }
}

TEST(ShortestPaths, AStarOnOpenGridIsOptimalAndFocused) {
  auto g = make_open_grid(8, 8);
  for (auto h : {Heuristic::Euclidean, Heuristic::Manhattan, Heuristic::Octile}) {
    SearchOptions opts;
    opts.heuristic = h;
    SCOPED_TRACE(std::string(to_string(h)));
    const auto& a = result_of(run("astar", g, "0_0", "7_7", opts));
    const auto& d = result_of(run("dijkstra", g, "0_0", "7_7"));
    EXPECT_DOUBLE_EQ(a.path_cost, 14.0);
    EXPECT_LE(a.nodes_visited, d.nodes_visited);
  }
}

TEST(ShortestPaths, AStarScoresPanel) {
  auto g = make_open_grid(3, 3);
  SearchOptions opts;
  opts.heuristic = Heuristic::Manhattan;
  auto steps = run("astar", g, "0_0", "2_2", opts);
  const auto& init = steps.front().overlay;
  ASSERT_EQ(init.scores.size(), 1u);
  EXPECT_DOUBLE_EQ(init.scores[0].g, 0.0);
  EXPECT_DOUBLE_EQ(init.scores[0].h, 4.0);
  EXPECT_DOUBLE_EQ(init.scores[0].f, 4.0);
  for (const auto& s : steps) {
    for (const auto& row : s.overlay.scores) EXPECT_DOUBLE_EQ(row.f, row.g + row.h);
  }
}

TEST(ShortestPaths, InadmissibleHeuristicsStillFindAPath) {
  auto g = make_open_grid(6, 6);
  SearchOptions heavy;
  heavy.heuristic = Heuristic::Manhattan;
  heavy.heuristic_weight = 5.0;
  for (const char* key : {"astar", "greedy_bfs"}) {
    SCOPED_TRACE(key);
    const auto& r = result_of(run(key, g, "0_0", "5_3", heavy));
    expect_path_valid(g, r, id(g, "0_0"), id(g, "5_3"));
  }
}

TEST(ShortestPaths, GreedyFollowsHeuristic) {
  // On a line greedy expands each node once on its way to the target.
  auto g = make_line_graph(6);
  const auto& r = result_of(run("greedy_bfs", g, "0", "5"));
  EXPECT_EQ(r.nodes_visited, 6);
  EXPECT_EQ(r.path->size(), 6u);
}

TEST(ShortestPaths, DfsFollowsAdjacencyDepthFirst) {
  // From a, DFS pushes b then c; c is popped first and leads to t.
  auto g = make_graph(keys({"a", "b", "c", "t"}), {{"a", "b", 1}, {"a", "c", 1}, {"b", "t", 1}, {"c", "t", 1}}, true);
  auto steps = run("dfs", g, "a", "t");
  const auto& r = result_of(steps);
  std::vector<NodeId> expected {id(g, "a"), id(g, "c"), id(g, "t")};
  EXPECT_EQ(*r.path, expected);
  bool saw_stack = false;
  for (const auto& s : steps) saw_stack |= !s.overlay.stack.empty();
  EXPECT_TRUE(saw_stack);
}

TEST(ShortestPaths, LowestNodeIdTieBreak) {
  // Two equal-cost routes s-x-t and s-y-t with y inserted first in adjacency
  // but x having the lower id.
  auto g = make_graph(keys({"s", "x", "y", "t"}), {{"s", "y", 1}, {"s", "x", 1}, {"y", "t", 1}, {"x", "t", 1}});
  SearchOptions by_id;
  by_id.tie_break = TieBreak::LowestNodeId;
  const auto& by_order = result_of(run("dijkstra", g, "s", "t"));
  const auto& lowest = result_of(run("dijkstra", g, "s", "t", by_id));
  EXPECT_EQ((*by_order.path)[1], id(g, "y"));
  EXPECT_EQ((*lowest.path)[1], id(g, "x"));
}

TEST(ShortestPaths, DijkstraQueuePanelHasNoStaleEntries) {
  auto g = make_weighted_graph();
  for (const auto& s : run("dijkstra", g, "A", "E")) {
    for (std::size_t i = 1; i < s.overlay.queue.size(); ++i) {
      EXPECT_LE(s.overlay.queue[i - 1].priority, s.overlay.queue[i].priority);
    }
    ASSERT_EQ(s.overlay.distances.size(), 6u);
    for (const auto& q : s.overlay.queue) {
      EXPECT_EQ(q.priority, s.overlay.distances[static_cast<std::size_t>(q.node)]);
    }
  }
}
