#pragma once

#include <affine/executors/executor.hpp>
#include <affine/executors/work_item.hpp>

#include <affine/futures/future.hpp>
#include <affine/futures/traits/is_future.hpp>

#include <affine/result/types/unit.hpp>

#include <affine/timers/millis.hpp>

#include <wheels/core/assert.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace affine::executors {

/*
 * Usage:
 *
 * executors::WorkerThreadExecutor worker;
 *
 * // Value producer
 * auto f = executors::Execute(worker, [] {
 *   return 42;
 * }, 1s);
 *
 * // Suspending producer: the worker awaits the returned future
 * auto g = executors::Execute(worker, [&] {
 *   return StartAsyncRead();  // -> futures::Future<Bytes>
 * }, 5s);
 *
 * Result<int> r = std::move(f).Get();
 *
 * Producers returning void complete with Unit
 *
 */

namespace detail {

template <typename T>
futures::Future<T> SubmitItem(IExecutor& exe,
                              typename WorkItem<T>::Producer producer,
                              timers::Millis timeout) {
  WHEELS_VERIFY(timeout >= timers::Millis::zero(),
                "Timeout must be non-negative");

  auto item = std::make_unique<WorkItem<T>>(std::move(producer), timeout);
  auto future = item->MakeFuture();

  exe.Submit(item.release());

  return future;
}

}  // namespace detail

// Value producer

template <typename F>
requires std::is_invocable_v<F&> &&
         (!futures::traits::SomeFuture<std::invoke_result_t<F&>>)
auto Execute(IExecutor& exe, F producer, timers::Millis timeout) {
  using R = std::invoke_result_t<F&>;

  if constexpr (std::is_void_v<R>) {
    return Execute(
        exe,
        [producer = std::move(producer)]() mutable {
          producer();
          return Unit{};
        },
        timeout);
  } else {
    return detail::SubmitItem<R>(
        exe, typename WorkItem<R>::ValueProducer{std::move(producer)},
        timeout);
  }
}

// Suspending producer

template <typename F>
requires std::is_invocable_v<F&> &&
         futures::traits::SomeFuture<std::invoke_result_t<F&>>
auto Execute(IExecutor& exe, F producer, timers::Millis timeout) {
  using T = futures::traits::ValueOf<std::invoke_result_t<F&>>;

  return detail::SubmitItem<T>(
      exe, typename WorkItem<T>::SuspendingProducer{std::move(producer)},
      timeout);
}

}  // namespace affine::executors
