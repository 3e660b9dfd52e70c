#include "stepgraph/core/stepper.hpp"

#include <utility>

#include "stepgraph/core/error.hpp"

namespace stepgraph::core {

Stepper::Stepper(StepProducerPtr producer) : producer_(std::move(producer)) {
  if (!producer_) throw RuntimeError("Stepper requires a producer");
}

bool Stepper::pull() {
  if (exhausted_) return false;
  ++producer_calls_;
  auto step = producer_->next();
  if (!step) {
    exhausted_ = true;
    return false;
  }
  buffer_.push_back(std::move(*step));
  // A terminal step is the last one; do not ask again.
  if (buffer_.back().is_final()) exhausted_ = true;
  return true;
}

const Step* Stepper::next() {
  if (cursor_ < buffer_.size()) {
    ++cursor_;
    return current();
  }
  if (!pull()) return nullptr;
  ++cursor_;
  return current();
}

const Step* Stepper::prev() noexcept {
  if (cursor_ > 0) --cursor_;
  return current();
}

const Step* Stepper::seek(std::size_t n) {
  while (buffer_.size() < n && pull()) {}
  cursor_ = n < buffer_.size() ? n : buffer_.size();
  return current();
}

const Step* Stepper::run_to_end() {
  while (pull()) {}
  cursor_ = buffer_.size();
  return current();
}

} // namespace stepgraph::core
