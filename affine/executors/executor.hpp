#pragma once

#include <affine/executors/task.hpp>

#include <affine/timers/millis.hpp>

namespace affine::executors {

// Runs work items under some threading model
// See executors::Execute for the typed submission API

struct IExecutor {
  virtual ~IExecutor() = default;

  // Takes ownership of item
  virtual void Submit(WorkItemBase* item) = 0;

  // Stops accepting work and waits at most grace for the
  // execution context to wind down. true iff it did
  virtual bool Dispose(timers::Millis grace) = 0;
};

}  // namespace affine::executors
