#pragma once

#include <affine/executors/executor.hpp>
#include <affine/executors/metrics.hpp>
#include <affine/executors/settings.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <memory>

namespace affine::executors {

namespace detail {

struct WorkerRuntime;

}  // namespace detail

// Runs work items one at a time, in submission order,
// on a single dedicated thread
//
// Items are submitted with executors::Execute from any thread.
// Each item's timeout starts when the worker dequeues it: on expiry
// the item's future is cancelled, the producer itself keeps running
// and its outcome is dropped.
//
// A suspending producer is awaited on the worker thread, so its inner
// future must be completed by some other thread

class WorkerThreadExecutor : public IExecutor {
 public:
  explicit WorkerThreadExecutor(WorkerSettings settings = WorkerSettings{});

  // Disposes with settings.grace_period if not disposed yet
  ~WorkerThreadExecutor() override;

  // Non-copyable
  WorkerThreadExecutor(const WorkerThreadExecutor&) = delete;
  WorkerThreadExecutor& operator=(const WorkerThreadExecutor&) = delete;

  // Non-movable
  WorkerThreadExecutor(WorkerThreadExecutor&&) = delete;
  WorkerThreadExecutor& operator=(WorkerThreadExecutor&&) = delete;

  // IExecutor
  void Submit(WorkItemBase* item) override;

  // Closes the queue and waits at most grace for the worker to drain it
  // and exit: every item accepted before Dispose still runs.
  // If the worker is stuck for longer than grace, the items it has not
  // dequeued yet are cancelled without running and the worker is
  // detached and left running: a warning is printed and false is
  // returned. Idempotent, must not race with itself
  bool Dispose(timers::Millis grace) override;

  bool Dispose() {
    return Dispose(settings_.grace_period);
  }

  // Items accepted but not yet dequeued
  size_t Backlog();

  // true iff called from a work item running on this executor
  bool InWorkerContext() const;

  Logger::Metrics Metrics() const;

 private:
  using Runtime = detail::WorkerRuntime;

  static void WorkerLoop(std::shared_ptr<Runtime> runtime) noexcept;

 private:
  const WorkerSettings settings_;

  // Shared with the worker thread, outlives us if the worker is abandoned
  std::shared_ptr<Runtime> runtime_;

  bool disposed_{false};
  bool stopped_in_time_{false};

  // NB: created last
  twist::ed::stdlike::thread worker_;
};

}  // namespace affine::executors
