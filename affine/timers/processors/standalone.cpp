#include <affine/timers/processors/standalone.hpp>

#include <mutex>

namespace affine::timers {

StandaloneProcessor::StandaloneProcessor()
    : worker_([this] {
        WorkerLoop();
      }) {
}

StandaloneProcessor::~StandaloneProcessor() {
  Stop();
}

void StandaloneProcessor::AddTimer(TimerBase* timer) {
  std::lock_guard lock(mutex_);

  queue_.Push(timer, TimersQueue::Clock::now());
  // Deadline could be earlier than the one worker sleeps until
  wakeups_.NotifyOne();
}

bool StandaloneProcessor::CancelTimer(TimerBase* timer) {
  // Timers run under mutex_, so a firing timer is waited out here
  std::lock_guard lock(mutex_);
  return queue_.Remove(timer);
}

size_t StandaloneProcessor::PendingTimers() {
  std::lock_guard lock(mutex_);
  return queue_.Size();
}

void StandaloneProcessor::WorkerLoop() {
  std::unique_lock lock(mutex_);

  while (!stop_requested_) {
    auto [ready, until_next_deadline] =
        queue_.GrabReadyTimers(TimersQueue::Clock::now());

    while (TimerBase* timer = ready.PopFront()) {
      timer->Run();
    }

    if (stop_requested_) {
      break;
    }

    if (until_next_deadline) {
      wakeups_.WaitFor(lock, *until_next_deadline);
    } else {
      wakeups_.Wait(lock);
    }
  }

  queue_.Clear();
}

void StandaloneProcessor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
    wakeups_.NotifyOne();
  }

  worker_.join();
}

}  // namespace affine::timers
