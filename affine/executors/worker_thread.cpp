#include <affine/executors/worker_thread.hpp>
#include <affine/executors/work_queue.hpp>

#include <affine/threads/blocking/event.hpp>

#include <affine/timers/processors/standalone.hpp>

#include <twist/ed/local/ptr.hpp>

#include <wheels/core/panic.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdio>
#include <optional>
#include <utility>

namespace affine::executors {

namespace detail {

// State shared by the executor and its worker thread

struct WorkerRuntime {
  explicit WorkerRuntime(WorkerSettings s)
      : settings(std::move(s)) {
  }

  // nullptr when timeouts must not fire for the next item
  timers::IProcessor* Timeouts() {
    switch (settings.timeout_policy) {
      case TimeoutPolicy::Enforce:
        return &timeouts;
      case TimeoutPolicy::Suppress:
        return nullptr;
      case TimeoutPolicy::SuppressUnderDebugger:
        return UnderDebugger() ? nullptr : &timeouts;
    }
    WHEELS_PANIC("Unknown timeout policy");
  }

  // Worker thread only
  bool UnderDebugger() {
    auto now = Clock::now();
    if (!last_probe || now - *last_probe >= settings.probe_interval) {
      traced = settings.debugger_probe();
      last_probe = now;
    }
    return traced;
  }

  // Cancels items which were accepted but never dequeued
  void DiscardBacklog() {
    auto backlog = queue.TakeAll();
    while (WorkItemBase* item = backlog.PopFront()) {
      item->Discard();
      logger.Increment("Discarded");
    }
  }

  void Record(futures::State outcome) {
    logger.Increment("Executed");
    logger.Increment(futures::ToString(outcome));
  }

  using Clock = std::chrono::steady_clock;

  WorkerSettings settings;
  std::optional<Clock::time_point> last_probe;
  bool traced{false};

  WorkQueue<WorkItemBase> queue;
  timers::StandaloneProcessor timeouts;
  Logger logger{kMetrics};
  threads::blocking::Event exited;
};

}  // namespace detail

static twist::ed::ThreadLocalPtr<detail::WorkerRuntime> current;

WorkerThreadExecutor::WorkerThreadExecutor(WorkerSettings settings)
    : settings_(settings),
      runtime_(std::make_shared<Runtime>(std::move(settings))),
      worker_([runtime = runtime_]() mutable {
        WorkerLoop(std::move(runtime));
      }) {
}

WorkerThreadExecutor::~WorkerThreadExecutor() {
  Dispose();
}

void WorkerThreadExecutor::Submit(WorkItemBase* item) {
  if (!runtime_->queue.Put(item)) {
    WHEELS_PANIC("Work item has been submitted after Dispose");
  }
}

bool WorkerThreadExecutor::Dispose(timers::Millis grace) {
  if (std::exchange(disposed_, true)) {
    return stopped_in_time_;
  }

  // Wakes the worker even if the queue is empty,
  // items accepted so far are still run
  runtime_->queue.Close();

  if (runtime_->exited.WaitFor(grace)) {
    worker_.join();
    stopped_in_time_ = true;
  } else {
    // Items racing with the stuck worker for the queue:
    // each one is either taken by it or discarded here
    runtime_->DiscardBacklog();

    fmt::print(stderr,
               "affine: worker thread did not stop within {}ms, "
               "abandoning it\n",
               grace.count());
    worker_.detach();
    stopped_in_time_ = false;
  }

  return stopped_in_time_;
}

size_t WorkerThreadExecutor::Backlog() {
  return runtime_->queue.Size();
}

bool WorkerThreadExecutor::InWorkerContext() const {
  return current == runtime_.get();
}

Logger::Metrics WorkerThreadExecutor::Metrics() const {
  return runtime_->logger.GatherMetrics();
}

void WorkerThreadExecutor::WorkerLoop(
    std::shared_ptr<Runtime> runtime) noexcept {
  current = runtime.get();

  // Drains the queue after Close
  while (WorkItemBase* item = runtime->queue.Take()) {
    runtime->Record(item->Run(runtime->Timeouts()));
  }

  current = nullptr;
  runtime->exited.Set();
}

}  // namespace affine::executors
