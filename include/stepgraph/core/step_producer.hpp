/*
  StepProducer — the pull interface every algorithm executable implements.

  A producer is a finite, forward-only sequence of Steps. Each call to next()
  advances the algorithm's own state machine just far enough to produce one
  Step; nothing runs between calls. The last Step carries a RunResult, after
  which next() returns std::nullopt.
*/
#pragma once

#include <memory>
#include <optional>

#include "stepgraph/core/step.hpp"

namespace stepgraph::core {

class StepProducer {
public:
  virtual ~StepProducer() noexcept = default;

  [[nodiscard]] virtual std::optional<Step> next() = 0;
};

using StepProducerPtr = std::unique_ptr<StepProducer>;

} // namespace stepgraph::core
