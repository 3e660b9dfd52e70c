#include <gtest/gtest.h>
#include <cmath>
#include "stepgraph/core/error.hpp"
#include "stepgraph/core/heuristics.hpp"
#include "stepgraph/core/options.hpp"
#include "test_utils.hpp"

using namespace stepgraph::core;
using namespace stepgraph::core::test;

TEST(Heuristics, Distances) {
  Point a {0.0, 0.0};
  Point b {3.0, 4.0};
  EXPECT_DOUBLE_EQ(heuristic_distance(Heuristic::Euclidean, a, b), 5.0);
  EXPECT_DOUBLE_EQ(heuristic_distance(Heuristic::Manhattan, a, b), 7.0);
  EXPECT_DOUBLE_EQ(heuristic_distance(Heuristic::Octile, a, b), 4.0 + (std::sqrt(2.0) - 1.0) * 3.0);
  EXPECT_DOUBLE_EQ(heuristic_distance(Heuristic::Zero, a, b), 0.0);
}

TEST(Heuristics, MissingPositionEstimatesZero) {
  std::vector<NodeSpec> nodes {{"a", Point{0.0, 0.0}, false}, {"b", std::nullopt, false}, {"c", Point{6.0, 8.0}, false}};
  auto g = make_graph(nodes, {});
  EXPECT_DOUBLE_EQ(estimate(Heuristic::Euclidean, g, 0, 1), 0.0);
  EXPECT_DOUBLE_EQ(estimate(Heuristic::Euclidean, g, 1, 2), 0.0);
  EXPECT_DOUBLE_EQ(estimate(Heuristic::Euclidean, g, 0, 2), 10.0);
}

TEST(Heuristics, NamesRoundTrip) {
  for (auto h : {Heuristic::Euclidean, Heuristic::Manhattan, Heuristic::Octile, Heuristic::Zero}) {
    EXPECT_EQ(parse_heuristic(to_string(h)), h);
  }
  EXPECT_THROW((void)parse_heuristic("chebyshev"), ConfigError);
}

TEST(SearchOptionsValidation, HeuristicWeight) {
  SearchOptions o;
  EXPECT_NO_THROW(validate(o));
  o.heuristic_weight = -0.5;
  EXPECT_THROW(validate(o), ConfigError);
  o.heuristic_weight = std::nan("");
  EXPECT_THROW(validate(o), ConfigError);
}
