#pragma once

#include <affine/futures/detail/shared_state.hpp>
#include <affine/futures/state.hpp>

#include <affine/support/constructor_bases.hpp>

#include <wheels/core/assert.hpp>

#include <chrono>
#include <utility>

namespace affine::futures {

// Consumer view of a single-assignment result
//
// Usage:
//
// auto f = executors::Execute(worker, [] { return 42; }, 1s);
// Result<int> r = std::move(f).Get();  // blocks the calling thread

template <typename T>
class [[nodiscard]] Future : public support::NonCopyableBase {
 public:
  using ValueType = T;
  using SharedState = detail::SharedState<T>;

  explicit Future(SharedState* state)
      : state_(state) {
  }

  // Movable
  Future(Future&& that) noexcept
      : state_(that.Release()) {
  }

  Future& operator=(Future&& that) noexcept {
    if (this != &that) {
      Reset();
      state_ = that.Release();
    }
    return *this;
  }

  ~Future() {
    Reset();
  }

  bool Valid() const {
    return state_ != nullptr;
  }

  bool IsReady() const {
    return Checked()->IsReady();
  }

  // Non-blocking, Pending until a terminal state is published
  State Peek() const {
    return Checked()->Peek();
  }

  // Blocks until a terminal state is published
  State Wait() const {
    return Checked()->Wait();
  }

  // false if the result is still pending after timeout
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    return Checked()->WaitFor(
        std::chrono::ceil<std::chrono::milliseconds>(timeout));
  }

  // Blocks, then moves the result out and releases the state
  // Failed -> Error holding the producer's exception
  // Cancelled -> Error holding cancel::CancelledException
  Result<T> Get() && {
    SharedState* state = Checked();
    state->Wait();

    Result<T> result = state->TakeResult();
    Reset();
    return result;
  }

 private:
  SharedState* Checked() const {
    WHEELS_VERIFY(state_ != nullptr, "Future is empty");
    return state_;
  }

  SharedState* Release() {
    return std::exchange(state_, nullptr);
  }

  void Reset() {
    if (SharedState* state = Release()) {
      state->ReleaseRef();
    }
  }

 private:
  SharedState* state_;
};

}  // namespace affine::futures
