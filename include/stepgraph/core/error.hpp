#pragma once

#include <stdexcept>
#include <string>

namespace stepgraph::core {

// Graph invariant violated at construction time (duplicate key, dangling edge, ...).
struct GraphError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Run misconfigured: unknown algorithm, unknown endpoint, forbidden negative weight.
struct ConfigError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace stepgraph::core
