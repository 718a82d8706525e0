#pragma once

#include <affine/cancel/cancelled.hpp>

#include <affine/futures/state.hpp>

#include <affine/result/make/err.hpp>
#include <affine/result/make/ok.hpp>
#include <affine/result/types/result.hpp>

#include <affine/support/constructor_bases.hpp>

#include <affine/threads/lockfree/ref_count.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <wheels/core/assert.hpp>

#include <algorithm>
#include <chrono>
#include <optional>

namespace affine::futures::detail {

// Single-assignment result cell
//
// Producers (at most the worker and one timer) race through TryCommit:
// the compare-and-set out of Pending decides the winner, every later
// attempt is a no-op returning false. The winner stores the result
// and only then publishes the terminal state, so a consumer which has
// observed a terminal state can read the result without locking

template <typename T>
class SharedState : public threads::lockfree::RefCounter<SharedState<T>>,
                    public support::PinnedBase {
  // Winner is writing the result, consumers keep waiting
  static constexpr uint32_t kCommitting = 1;

 public:
  SharedState() {
    // Producer and consumer refs
    this->AddRef(2);
  }

  // Producer side

  bool TrySetValue(T value) {
    if (!TryCommit()) {
      return false;
    }

    result_.emplace(result::Ok(std::move(value)));
    Publish(State::Resolved);
    return true;
  }

  bool TrySetError(Error error) {
    if (!TryCommit()) {
      return false;
    }

    result_.emplace(result::Err(std::move(error)));
    Publish(State::Failed);
    return true;
  }

  bool TryCancel() {
    if (!TryCommit()) {
      return false;
    }

    result_.emplace(result::Err(cancel::CancelledError()));
    Publish(State::Cancelled);
    return true;
  }

  // Consumer side

  State Peek() const {
    uint32_t state = state_.load(std::memory_order::acquire);
    return IsTerminal(state) ? static_cast<State>(state) : State::Pending;
  }

  bool IsReady() const {
    return IsTerminal(state_.load(std::memory_order::acquire));
  }

  State Wait() {
    uint32_t state = state_.load(std::memory_order::acquire);

    while (!IsTerminal(state)) {
      twist::ed::futex::Wait(state_, state, std::memory_order::acquire);
      state = state_.load(std::memory_order::acquire);
    }

    return static_cast<State>(state);
  }

  // false on timeout
  bool WaitFor(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    const auto deadline = Clock::now() + timeout;
    uint32_t state = state_.load(std::memory_order::acquire);

    while (!IsTerminal(state)) {
      auto now = Clock::now();
      if (now >= deadline) {
        return false;
      }

      auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      twist::ed::futex::WaitTimed(state_, state,
                                  std::max(left, std::chrono::milliseconds{1}));
      state = state_.load(std::memory_order::acquire);
    }

    return true;
  }

  // Only after a terminal state was observed, at most once
  Result<T> TakeResult() {
    WHEELS_VERIFY(IsReady(), "Result is not ready yet");
    WHEELS_VERIFY(result_.has_value(), "Result has already been taken");

    Result<T> result = std::move(*result_);
    result_.reset();
    return result;
  }

 private:
  static bool IsTerminal(uint32_t state) {
    return state > kCommitting;
  }

  bool TryCommit() {
    uint32_t expected = static_cast<uint32_t>(State::Pending);
    // result_ is published by the release store in Publish
    return state_.compare_exchange_strong(expected, kCommitting,
                                          std::memory_order::relaxed,
                                          std::memory_order::relaxed);
  }

  void Publish(State terminal) {
    auto wake_key = twist::ed::futex::PrepareWake(state_);
    state_.store(static_cast<uint32_t>(terminal), std::memory_order::release);
    twist::ed::futex::WakeAll(wake_key);
  }

 private:
  twist::ed::stdlike::atomic<uint32_t> state_{
      static_cast<uint32_t>(State::Pending)};
  std::optional<Result<T>> result_{};
};

}  // namespace affine::futures::detail
