#pragma once

#include <affine/executors/executor.hpp>

#include <affine/threads/lockfree/counter.hpp>

#include <cstdint>

namespace affine::executors {

// Decorator which counts submissions accepted by the underlying executor
// Outcomes of the submitted items don't matter

class ObservableExecutor : public IExecutor {
 public:
  explicit ObservableExecutor(IExecutor& underlying);

  // Non-copyable
  ObservableExecutor(const ObservableExecutor&) = delete;
  ObservableExecutor& operator=(const ObservableExecutor&) = delete;

  // Non-movable
  ObservableExecutor(ObservableExecutor&&) = delete;
  ObservableExecutor& operator=(ObservableExecutor&&) = delete;

  // IExecutor
  void Submit(WorkItemBase* item) override;
  bool Dispose(timers::Millis grace) override;

  uint64_t SubmissionCount() const {
    return submissions_.Value();
  }

 private:
  IExecutor& underlying_;
  threads::lockfree::Counter submissions_;
};

}  // namespace affine::executors
