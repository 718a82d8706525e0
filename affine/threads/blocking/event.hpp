#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace affine::threads::blocking {

// One-shot event

class Event {
  enum State : uint32_t { NotReady = 0, Ready = 1 };

 public:
  void Wait() {
    while (ready_.load(std::memory_order::acquire) == State::NotReady) {
      twist::ed::futex::Wait(ready_, State::NotReady,
                             std::memory_order::acquire);
    }
  }

  // false on timeout
  bool WaitFor(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    const auto deadline = Clock::now() + timeout;

    while (ready_.load(std::memory_order::acquire) == State::NotReady) {
      auto now = Clock::now();
      if (now >= deadline) {
        return false;
      }

      auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      twist::ed::futex::WaitTimed(ready_, State::NotReady,
                                  std::max(left, std::chrono::milliseconds{1}));
    }

    return true;
  }

  bool IsSet() const {
    return ready_.load(std::memory_order::acquire) == State::Ready;
  }

  void Set() {
    auto wake_key = twist::ed::futex::PrepareWake(ready_);
    ready_.store(State::Ready, std::memory_order::release);
    twist::ed::futex::WakeAll(wake_key);
  }

 private:
  twist::ed::stdlike::atomic<uint32_t> ready_{State::NotReady};
};

}  // namespace affine::threads::blocking
