#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace affine::threads::blocking::stdlike {

class CondVar {
  using Epoch = uint32_t;

 public:
  CondVar() = default;

  // Pinned
  CondVar(const CondVar&) = delete;
  CondVar& operator=(const CondVar&) = delete;

  CondVar(CondVar&&) = delete;
  CondVar& operator=(CondVar&&) = delete;

  // Lock - BasicLockable, must be held by the caller
  // Epoch is sampled under the lock: a Notify issued after the caller
  // released the lock bumps the epoch and the futex wait falls through
  template <class Lock>
  void Wait(Lock& lock) {
    Epoch entry = epoch_.load(std::memory_order::relaxed);
    lock.unlock();

    twist::ed::futex::Wait(epoch_, entry, std::memory_order::relaxed);

    lock.lock();
  }

  // Spurious and early wakeups are possible, recheck the predicate
  template <class Lock>
  void WaitFor(Lock& lock, std::chrono::milliseconds timeout) {
    Epoch entry = epoch_.load(std::memory_order::relaxed);
    lock.unlock();

    twist::ed::futex::WaitTimed(epoch_, entry,
                                std::max(timeout, std::chrono::milliseconds{1}));

    lock.lock();
  }

  void NotifyOne() {
    auto wake_key = twist::ed::futex::PrepareWake(epoch_);
    epoch_.fetch_add(1, std::memory_order::relaxed);
    twist::ed::futex::WakeOne(wake_key);
  }

  void NotifyAll() {
    auto wake_key = twist::ed::futex::PrepareWake(epoch_);
    epoch_.fetch_add(1, std::memory_order::relaxed);
    twist::ed::futex::WakeAll(wake_key);
  }

 private:
  twist::ed::stdlike::atomic<Epoch> epoch_{0};
};

}  // namespace affine::threads::blocking::stdlike
