#include "stepgraph/core/generators.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

namespace {

constexpr double kCanvasW = 800.0;
constexpr double kCanvasH = 500.0;

void check_weights(std::int32_t lo, std::int32_t hi) {
  if (lo > hi) throw ConfigError("weight_min must not exceed weight_max");
}

void check_probability(double p, const char* name) {
  if (!(p >= 0.0 && p <= 1.0)) throw ConfigError(std::string(name) + " must be in [0, 1]");
}

} // namespace

Graph generate_random(const RandomGraphParams& params, std::uint32_t seed) {
  if (params.num_nodes < 1) throw ConfigError("num_nodes must be >= 1");
  check_probability(params.edge_probability, "edge_probability");
  check_weights(params.weight_min, params.weight_max);

  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::uniform_real_distribution<double> jitter(-30.0, 30.0);
  std::uniform_int_distribution<std::int32_t> weight(params.weight_min, params.weight_max);
  auto draw_weight = [&]() { return params.weighted ? static_cast<Weight>(weight(rng)) : 1.0; };

  const std::int32_t n = params.num_nodes;
  const double margin = 40.0;
  const double radius = std::min(kCanvasW, kCanvasH) * 0.35;
  std::vector<NodeSpec> nodes;
  nodes.reserve(static_cast<std::size_t>(n));
  for (std::int32_t i = 0; i < n; ++i) {
    const double angle = 2.0 * std::numbers::pi * i / n;
    double x = kCanvasW / 2 + radius * std::cos(angle) + jitter(rng);
    double y = kCanvasH / 2 + radius * std::sin(angle) + jitter(rng);
    x = std::clamp(x, margin, kCanvasW - margin);
    y = std::clamp(y, margin, kCanvasH - margin);
    nodes.push_back(NodeSpec{std::to_string(i), Point{x, y}, false});
  }

  std::vector<EdgeSpec> edges;
  std::set<std::pair<std::int32_t, std::int32_t>> present;
  auto add = [&](std::int32_t u, std::int32_t v) {
    edges.push_back(EdgeSpec{std::to_string(u), std::to_string(v), draw_weight()});
    present.emplace(u, v);
  };
  for (std::int32_t i = 0; i < n; ++i) {
    for (std::int32_t j = params.directed ? 0 : i + 1; j < n; ++j) {
      if (i == j) continue;
      if (unit(rng) < params.edge_probability) add(i, j);
    }
  }

  std::vector<std::int32_t> order(static_cast<std::size_t>(n));
  for (std::int32_t i = 0; i < n; ++i) order[static_cast<std::size_t>(i)] = i;
  std::shuffle(order.begin(), order.end(), rng);
  for (std::size_t k = 1; k < order.size(); ++k) {
    const auto u = order[k - 1];
    const auto v = order[k];
    const bool exists = present.count({u, v}) || (!params.directed && present.count({v, u}));
    if (!exists) add(u, v);
  }
  return Graph::from_lists(nodes, edges, params.directed);
}

Graph generate_grid(const GridGraphParams& params, std::uint32_t seed) {
  if (params.rows < 1 || params.cols < 1) throw ConfigError("rows and cols must be >= 1");
  check_probability(params.wall_probability, "wall_probability");

  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  auto key = [](std::int32_t r, std::int32_t c) { return std::to_string(r) + "_" + std::to_string(c); };

  std::vector<NodeSpec> nodes;
  nodes.reserve(static_cast<std::size_t>(params.rows) * static_cast<std::size_t>(params.cols));
  for (std::int32_t r = 0; r < params.rows; ++r) {
    for (std::int32_t c = 0; c < params.cols; ++c) {
      const bool interior = r != 0 && r != params.rows - 1 && c != 0 && c != params.cols - 1;
      const bool wall = interior && unit(rng) < params.wall_probability;
      nodes.push_back(NodeSpec{key(r, c), Point{static_cast<double>(c), static_cast<double>(r)}, wall});
    }
  }

  // Undirected: right and down cover every neighbour pair once.
  std::vector<std::pair<std::int32_t, std::int32_t>> dirs {{0, 1}, {1, 0}};
  if (params.directed) dirs = {{0, 1}, {0, -1}, {1, 0}, {-1, 0}};
  std::vector<EdgeSpec> edges;
  for (std::int32_t r = 0; r < params.rows; ++r) {
    for (std::int32_t c = 0; c < params.cols; ++c) {
      for (auto [dr, dc] : dirs) {
        const std::int32_t nr = r + dr;
        const std::int32_t nc = c + dc;
        if (nr < 0 || nr >= params.rows || nc < 0 || nc >= params.cols) continue;
        edges.push_back(EdgeSpec{key(r, c), key(nr, nc), 1.0});
      }
    }
  }
  return Graph::from_lists(nodes, edges, params.directed);
}

Graph generate_scale_free(const ScaleFreeParams& params, std::uint32_t seed) {
  if (params.num_nodes < 1) throw ConfigError("num_nodes must be >= 1");
  if (params.m < 1) throw ConfigError("m must be >= 1");
  check_weights(params.weight_min, params.weight_max);

  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::uniform_real_distribution<double> jitter(-20.0, 20.0);
  std::uniform_int_distribution<std::int32_t> weight(params.weight_min, params.weight_max);
  auto draw_weight = [&]() { return params.weighted ? static_cast<Weight>(weight(rng)) : 1.0; };

  const std::int32_t n = params.num_nodes;
  const std::int32_t initial = std::min(params.m + 1, n);
  const double margin = 50.0;
  std::vector<NodeSpec> nodes;
  std::vector<EdgeSpec> edges;
  std::vector<std::int64_t> degree;

  for (std::int32_t i = 0; i < initial; ++i) {
    const double angle = 2.0 * std::numbers::pi * i / initial;
    nodes.push_back(NodeSpec{std::to_string(i),
                             Point{kCanvasW / 2 + 60.0 * std::cos(angle), kCanvasH / 2 + 60.0 * std::sin(angle)},
                             false});
    degree.push_back(initial - 1);
  }
  for (std::int32_t i = 0; i < initial; ++i) {
    for (std::int32_t j = i + 1; j < initial; ++j) {
      edges.push_back(EdgeSpec{std::to_string(i), std::to_string(j), draw_weight()});
    }
  }

  for (std::int32_t i = initial; i < n; ++i) {
    const double angle = 2.0 * std::numbers::pi * i / 7.0;
    const double rad = 40.0 + i * 15.0;
    double x = std::clamp(kCanvasW / 2 + rad * std::cos(angle) + jitter(rng), margin, kCanvasW - margin);
    double y = std::clamp(kCanvasH / 2 + rad * std::sin(angle) + jitter(rng), margin, kCanvasH - margin);
    nodes.push_back(NodeSpec{std::to_string(i), Point{x, y}, false});
    degree.push_back(0);

    // Degrees are floored at 1 so isolated nodes can still be picked.
    std::int64_t total = 0;
    for (auto d : degree) total += std::max<std::int64_t>(d, 1);
    std::set<std::int32_t> targets;
    for (std::int32_t attempt = 0; static_cast<std::int32_t>(targets.size()) < params.m && attempt < params.m * 20;
         ++attempt) {
      const double pick = unit(rng) * static_cast<double>(total);
      double cumul = 0.0;
      for (std::int32_t cand = 0; cand <= i; ++cand) {
        cumul += static_cast<double>(std::max<std::int64_t>(degree[static_cast<std::size_t>(cand)], 1));
        if (cumul >= pick) {
          if (cand != i) targets.insert(cand);
          break;
        }
      }
    }
    for (auto t : targets) {
      edges.push_back(EdgeSpec{std::to_string(i), std::to_string(t), draw_weight()});
      ++degree[static_cast<std::size_t>(i)];
      ++degree[static_cast<std::size_t>(t)];
    }
  }
  return Graph::from_lists(nodes, edges, params.directed);
}

} // namespace stepgraph::core
