#pragma once

#include <affine/futures/future.hpp>

#include <affine/support/constructor_bases.hpp>

#include <stdexcept>
#include <tuple>
#include <utility>

namespace affine::futures {

// Promise was destroyed without producing a result

struct BrokenPromise : public std::logic_error {
  BrokenPromise()
      : std::logic_error("affine: promise destroyed without a result") {
  }
};

template <typename T>
class [[nodiscard]] Promise : public support::NonCopyableBase {
 public:
  using SharedState = detail::SharedState<T>;

  explicit Promise(SharedState* state)
      : state_(state) {
  }

  // Movable
  Promise(Promise&& that) noexcept
      : state_(that.Release()) {
  }
  Promise& operator=(Promise&&) = delete;

  void SetValue(T value) && {
    SharedState* state = Take();
    state->TrySetValue(std::move(value));
    state->ReleaseRef();
  }

  void SetError(Error error) && {
    SharedState* state = Take();
    state->TrySetError(std::move(error));
    state->ReleaseRef();
  }

  ~Promise() {
    if (state_ != nullptr) {
      SharedState* state = Release();
      state->TrySetError(std::make_exception_ptr(BrokenPromise{}));
      state->ReleaseRef();
    }
  }

 private:
  SharedState* Take() {
    WHEELS_VERIFY(state_ != nullptr, "Promise has already been fulfilled");
    return Release();
  }

  SharedState* Release() {
    return std::exchange(state_, nullptr);
  }

 private:
  SharedState* state_;
};

/*
 * Usage:
 *
 * auto [f, p] = futures::Contract<int>();
 *
 * std::thread producer([p = std::move(p)]() mutable {
 *   std::move(p).SetValue(7);
 * });
 *
 */

template <typename T>
std::tuple<Future<T>, Promise<T>> Contract() {
  auto* state = new detail::SharedState<T>{};
  return {Future<T>(state), Promise<T>(state)};
}

}  // namespace affine::futures
