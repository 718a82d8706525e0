#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstdint>

namespace affine::threads::blocking::stdlike {

class Mutex {
 public:
  Mutex() = default;

  // Pinned
  Mutex(const Mutex&) = delete;
  Mutex& operator=(const Mutex&) = delete;

  Mutex(Mutex&&) = delete;
  Mutex& operator=(Mutex&&) = delete;

  void Lock();

  bool TryLock() {
    return CompareExchange(State::Unlocked, State::Locked) == State::Unlocked;
  }

  void Unlock();

  // BasicLockable
  // https://en.cppreference.com/w/cpp/named_req/BasicLockable

  void lock() {  // NOLINT
    Lock();
  }

  bool try_lock() {  // NOLINT
    return TryLock();
  }

  void unlock() {  // NOLINT
    Unlock();
  }

 private:
  enum State : uint32_t {
    Unlocked = 0,
    Locked = 1,     // no waiters
    Contended = 2,  // there may be waiters
  };

  uint32_t CompareExchange(uint32_t expected, uint32_t desired) {
    state_.compare_exchange_strong(expected, desired,
                                   std::memory_order::acquire,
                                   std::memory_order::relaxed);
    return expected;
  }

 private:
  twist::ed::stdlike::atomic<uint32_t> state_{State::Unlocked};
};

}  // namespace affine::threads::blocking::stdlike
