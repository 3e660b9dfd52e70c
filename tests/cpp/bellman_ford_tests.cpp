#include <gtest/gtest.h>
#include "stepgraph/core/algorithms.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

TEST(BellmanFord, HandlesNegativeEdges) {
  auto g = make_negative_dag();
  auto steps = run("bellman_ford", g, "S", "T");
  expect_sequence_well_formed(steps);
  const auto& r = result_of(steps);
  EXPECT_FALSE(r.negative_cycle);
  EXPECT_DOUBLE_EQ(r.path_cost, 4.0);
  std::vector<NodeId> expected {id(g, "S"), id(g, "B"), id(g, "A"), id(g, "T")};
  EXPECT_EQ(*r.path, expected);
}

TEST(BellmanFord, ReachableNegativeCycleDetected) {
  auto g = make_negative_cycle_graph(true);
  const auto& r = result_of(run("bellman_ford", g, "S", "T"));
  EXPECT_TRUE(r.negative_cycle);
  EXPECT_FALSE(r.path.has_value());
  EXPECT_EQ(r.path_cost, kInf);
}

TEST(BellmanFord, UnreachableNegativeCycleDetected) {
  auto g = make_negative_cycle_graph(false);
  const auto& r = result_of(run("bellman_ford", g, "S", "T"));
  EXPECT_TRUE(r.negative_cycle);
  EXPECT_FALSE(r.path.has_value());
}

TEST(BellmanFord, UndirectedNegativeEdgeIsACycle) {
  auto g = make_graph(keys({"a", "b", "c"}), {{"a", "b", 2}, {"b", "c", -1}});
  const auto& r = result_of(run("bellman_ford", g, "a", "c"));
  EXPECT_TRUE(r.negative_cycle);
}

TEST(BellmanFord, RoundsAreAnnouncedAndConvergeEarly) {
  auto g = make_line_graph(6, true);
  auto steps = run("bellman_ford", g, "0", "5");
  std::int32_t last_round = 0;
  for (const auto& s : steps) {
    ASSERT_TRUE(s.overlay.round.has_value());
    EXPECT_GE(*s.overlay.round, last_round);
    last_round = *s.overlay.round;
    EXPECT_EQ(s.overlay.distances.size(), 6u);
  }
  // Arcs are in insertion order so one round settles the chain; the second
  // confirms nothing changed.
  EXPECT_EQ(last_round, 2);
  EXPECT_DOUBLE_EQ(result_of(steps).path_cost, 5.0);
}

TEST(BellmanFord, ReRelaxationCountsEveryImprovement) {
  // Arcs listed so that T's distance improves twice in the first round.
  auto g = make_graph(keys({"S", "A", "T"}), {{"S", "T", 10}, {"S", "A", 1}, {"A", "T", 1}}, true);
  auto steps = run("bellman_ford", g, "S", "T");
  const auto& r = result_of(steps);
  EXPECT_EQ(r.edges_relaxed, 3);
  EXPECT_EQ(count_relaxed_events(steps), 3);
  EXPECT_DOUBLE_EQ(r.path_cost, 2.0);
}

TEST(BellmanFord, NonImprovingArcsAreIgnored) {
  auto g = make_graph(keys({"S", "A", "T"}), {{"S", "A", 1}, {"A", "T", 1}, {"S", "T", 5}}, true);
  auto steps = run("bellman_ford", g, "S", "T");
  bool ignored = false;
  for (const auto& s : steps)
    for (const auto& c : s.edge_changes) ignored |= (c.edge == 2 && c.state == EdgeState::Ignored);
  EXPECT_TRUE(ignored);
  EXPECT_EQ(result_of(steps).edges_relaxed, 2);
}
