#pragma once

#include <affine/timers/timer.hpp>

namespace affine::timers {

struct IProcessor {
  virtual ~IProcessor() = default;

  virtual void AddTimer(TimerBase*) = 0;

  // true iff timer was removed before it fired
  // After return the processor never touches the timer again
  virtual bool CancelTimer(TimerBase*) = 0;
};

}  // namespace affine::timers
