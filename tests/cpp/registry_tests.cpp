#include <gtest/gtest.h>
#include <set>
#include "stepgraph/core/algorithms.hpp"
#include "stepgraph/core/error.hpp"
#include "stepgraph/core/registry.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

TEST(Registry, DefaultOrderAndLabels) {
  const auto& reg = default_registry();
  std::vector<std::string> keys_in_order;
  for (const auto& info : reg.list()) keys_in_order.push_back(info.key);
  EXPECT_EQ(keys_in_order, (std::vector<std::string>{"bfs", "dfs", "dijkstra", "astar", "bidirectional_bfs",
                                                     "bellman_ford", "floyd_warshall", "greedy_bfs"}));
  EXPECT_EQ(reg.get("astar").label, "A* Search");
  EXPECT_EQ(reg.get("bfs").complexity_time, "O(V + E)");
  EXPECT_TRUE(reg.get("floyd_warshall").is_all_pairs);
}

TEST(Registry, DescriptorsAreComplete) {
  for (const auto& info : default_registry().list()) {
    SCOPED_TRACE(info.key);
    EXPECT_FALSE(info.label.empty());
    EXPECT_TRUE(static_cast<bool>(info.factory));
    EXPECT_FALSE(info.pseudocode.empty());
    EXPECT_FALSE(info.tags.empty());
    EXPECT_FALSE(info.complexity_time.empty());
    EXPECT_FALSE(info.complexity_space.empty());
    EXPECT_FALSE(info.description.empty());
  }
}

TEST(Registry, HeuristicAlgorithms) {
  const auto& reg = default_registry();
  EXPECT_TRUE(reg.get("astar").has_heuristic());
  EXPECT_TRUE(reg.get("greedy_bfs").has_heuristic());
  EXPECT_FALSE(reg.get("dijkstra").has_heuristic());
  EXPECT_EQ(reg.get("astar").heuristics.size(), 4u);
}

TEST(Registry, LookupMisses) {
  const auto& reg = default_registry();
  EXPECT_EQ(reg.find("quantum"), nullptr);
  EXPECT_THROW((void)reg.get("quantum"), ConfigError);
}

TEST(Registry, ByTag) {
  std::set<std::string> negative;
  for (const auto* info : default_registry().by_tag("negative-edges")) negative.insert(info->key);
  EXPECT_EQ(negative, (std::set<std::string>{"bellman_ford", "floyd_warshall"}));
  EXPECT_TRUE(default_registry().by_tag("no-such-tag").empty());
}

TEST(Registry, AddRejectsDuplicatesAndIncompleteEntries) {
  Registry reg;
  AlgorithmInfo info;
  info.key = "bfs2";
  info.label = "BFS again";
  info.factory = make_bfs;
  info.pseudocode = bfs_pseudocode();
  reg.add(info);
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_THROW(reg.add(info), ConfigError);

  AlgorithmInfo no_factory;
  no_factory.key = "broken";
  EXPECT_THROW(reg.add(no_factory), ConfigError);

  AlgorithmInfo no_key;
  no_key.factory = make_dfs;
  EXPECT_THROW(reg.add(no_key), ConfigError);
}

TEST(Registry, CustomRegistryDrivesFactories) {
  Registry reg;
  AlgorithmInfo info;
  info.key = "shortest";
  info.label = "Shortest";
  info.factory = make_dijkstra;
  reg.add(info);
  auto g = make_weighted_graph();
  auto producer = reg.get("shortest").factory(g, id(g, "A"), id(g, "E"), SearchOptions{});
  auto steps = drain(*producer);
  EXPECT_DOUBLE_EQ(result_of(steps).path_cost, 20.0);
}
