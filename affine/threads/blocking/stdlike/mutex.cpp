#include <affine/threads/blocking/stdlike/mutex.hpp>

#include <twist/ed/wait/futex.hpp>

namespace affine::threads::blocking::stdlike {

void Mutex::Lock() {
  if (CompareExchange(State::Unlocked, State::Locked) == State::Unlocked) {
    return;  // fast path
  }

  // Pessimistically mark the mutex contended, so that
  // the owner knows to wake someone on Unlock
  while (state_.exchange(State::Contended, std::memory_order::acquire) !=
         State::Unlocked) {
    twist::ed::futex::Wait(state_, State::Contended,
                           std::memory_order::relaxed);
  }
}

void Mutex::Unlock() {
  auto wake_key = twist::ed::futex::PrepareWake(state_);

  if (state_.exchange(State::Unlocked, std::memory_order::release) ==
      State::Contended) {
    twist::ed::futex::WakeOne(wake_key);
  }
}

}  // namespace affine::threads::blocking::stdlike
