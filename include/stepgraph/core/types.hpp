/* Core type aliases and classification enums.
 *
 * - NodeId/EdgeId: int32 dense indices assigned in insertion order
 * - Weight: double (edge weights may be negative for Bellman-Ford/Floyd-Warshall)
 * - NodeState/EdgeState: display classification carried by Steps; algorithms
 *   keep their own visited/distance sets and never read these back.
 */
#pragma once

#include <cstdint>
#include <limits>
#include <string_view>

namespace stepgraph::core {

using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Weight = double;

inline constexpr Weight kInf = std::numeric_limits<Weight>::infinity();

// 2-D node position used by geometric heuristics and grid layouts.
struct Point {
  double x {0.0};
  double y {0.0};
  friend bool operator==(const Point& a, const Point& b) noexcept {
    return a.x == b.x && a.y == b.y;
  }
};

enum class NodeState : std::uint8_t {
  Unvisited = 0,
  Frontier,
  Visited,
  Current,
  OnPath,
  Blocked,
  Source,
  Target
};

enum class EdgeState : std::uint8_t {
  Default = 0,
  Relaxed,   // edge improved (or discovered) its head node's label
  Chosen,    // edge lies on the reported path
  Ignored    // edge examined without improvement
};

// Ordering among frontier entries with equal priority.
enum class TieBreak {
  InsertionOrder = 1,   // first pushed, first popped (FIFO among equals)
  LowestNodeId = 2      // smaller NodeId first, then insertion order
};

[[nodiscard]] std::string_view to_string(NodeState s) noexcept;
[[nodiscard]] std::string_view to_string(EdgeState s) noexcept;

} // namespace stepgraph::core
