/*
  Seeded graph generators. Output is a pure function of the parameters and
  the seed (std::mt19937).
*/
#pragma once

#include <cstdint>

#include "stepgraph/core/graph.hpp"

namespace stepgraph::core {

// Erdos-Renyi edges plus a spanning backbone over a shuffled node order, so
// every node is connected (weakly, when directed). Node keys are "0".."n-1",
// laid out on a jittered circle.
struct RandomGraphParams {
  std::int32_t num_nodes {10};
  double edge_probability {0.3};
  bool directed {false};
  bool weighted {true};
  std::int32_t weight_min {1};
  std::int32_t weight_max {10};
};

// 4-connected grid; keys "r_c", unit weights, node (r, c) at position (c, r).
// Interior cells are blocked with probability wall_probability; border cells
// are never blocked.
struct GridGraphParams {
  std::int32_t rows {6};
  std::int32_t cols {8};
  double wall_probability {0.25};
  bool directed {false};
};

// Preferential attachment: a clique of m + 1 nodes, then each new node links
// to up to m existing nodes chosen with probability proportional to degree.
struct ScaleFreeParams {
  std::int32_t num_nodes {15};
  std::int32_t m {2};
  bool directed {false};
  bool weighted {true};
  std::int32_t weight_min {1};
  std::int32_t weight_max {10};
};

// All generators throw ConfigError on out-of-range parameters.
[[nodiscard]] Graph generate_random(const RandomGraphParams& params, std::uint32_t seed);
[[nodiscard]] Graph generate_grid(const GridGraphParams& params, std::uint32_t seed);
[[nodiscard]] Graph generate_scale_free(const ScaleFreeParams& params, std::uint32_t seed);

} // namespace stepgraph::core
