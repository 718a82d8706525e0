#pragma once

#include <affine/timers/processor.hpp>
#include <affine/timers/timers_queue.hpp>

#include <affine/threads/blocking/stdlike/condition_variable.hpp>
#include <affine/threads/blocking/stdlike/mutex.hpp>

#include <twist/ed/stdlike/thread.hpp>

namespace affine::timers {

// Takes up one thread to process timers
//
// Timers are run on the processor thread with the processor lock held:
// Run must be short and must not call back into the processor.
// Timers pending at destruction never fire

class StandaloneProcessor : public IProcessor {
 public:
  StandaloneProcessor();
  ~StandaloneProcessor() override;

  // Non-copyable
  StandaloneProcessor(const StandaloneProcessor&) = delete;
  StandaloneProcessor& operator=(const StandaloneProcessor&) = delete;

  // Non-movable
  StandaloneProcessor(StandaloneProcessor&&) = delete;
  StandaloneProcessor& operator=(StandaloneProcessor&&) = delete;

  // IProcessor
  void AddTimer(TimerBase* timer) override;
  bool CancelTimer(TimerBase* timer) override;

  size_t PendingTimers();

 private:
  void WorkerLoop();

  void Stop();

 private:
  using Mutex = threads::blocking::stdlike::Mutex;

  Mutex mutex_;
  threads::blocking::stdlike::CondVar wakeups_;
  TimersQueue queue_;         // guarded by mutex_
  bool stop_requested_{false};  // guarded by mutex_

  // NB: worker is created last to have every
  // other member constructed before it starts
  twist::ed::stdlike::thread worker_;
};

}  // namespace affine::timers
