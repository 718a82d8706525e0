#pragma once

#include <affine/timers/millis.hpp>

#include <wheels/intrusive/list.hpp>

#include <chrono>

namespace affine::timers {

struct ITimer {
  virtual ~ITimer() = default;

  virtual Millis GetDelay() = 0;

  // Invoked by the processor once the delay has elapsed
  virtual void Run() noexcept = 0;
};

struct TimerBase : public ITimer, public wheels::IntrusiveListNode<TimerBase> {
  std::chrono::steady_clock::time_point deadline;
};

}  // namespace affine::timers
