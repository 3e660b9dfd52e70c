/*
  Stepper — bidirectional playback over a forward-only step producer.

  Every Step pulled from the producer is appended to a history buffer that
  never shrinks; moving backwards only moves the cursor. Returned pointers
  stay valid for the lifetime of the Stepper. nullptr is the "no step"
  sentinel: before the first step, or when the producer is exhausted.
*/
#pragma once

#include <cstdint>
#include <deque>

#include "stepgraph/core/step.hpp"
#include "stepgraph/core/step_producer.hpp"

namespace stepgraph::core {

class Stepper {
public:
  explicit Stepper(StepProducerPtr producer);

  Stepper(const Stepper&) = delete;
  Stepper& operator=(const Stepper&) = delete;
  Stepper(Stepper&&) = default;
  Stepper& operator=(Stepper&&) = default;

  // Advance one position, pulling from the producer only when the cursor is
  // at the end of the buffer. Returns the new current step, or nullptr when
  // the producer is exhausted (the cursor does not move).
  const Step* next();
  // Move back one position; no-op at position 0. Returns the current step.
  const Step* prev() noexcept;
  void rewind() noexcept { cursor_ = 0; }
  // Move to position n, pulling forward as needed. Stops at the last step
  // when the producer is exhausted first. Returns the current step.
  const Step* seek(std::size_t n);
  // Pull until the producer is exhausted; leaves the cursor on the last step.
  const Step* run_to_end();

  [[nodiscard]] const Step* current() const noexcept {
    return cursor_ == 0 ? nullptr : &buffer_[cursor_ - 1];
  }
  // Number of steps consumed by playback; current() is buffer[position()-1].
  [[nodiscard]] std::size_t position() const noexcept { return cursor_; }
  [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }
  [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }
  [[nodiscard]] std::int64_t producer_calls() const noexcept { return producer_calls_; }
  // Buffered step by index; throws std::out_of_range.
  [[nodiscard]] const Step& at(std::size_t i) const { return buffer_.at(i); }
  [[nodiscard]] const std::deque<Step>& history() const noexcept { return buffer_; }

private:
  bool pull();

  StepProducerPtr producer_;
  std::deque<Step> buffer_ {};
  std::size_t cursor_ {0};
  bool exhausted_ {false};
  std::int64_t producer_calls_ {0};
};

} // namespace stepgraph::core
