#pragma once

#include <affine/futures/future.hpp>

#include <type_traits>

namespace affine::futures::traits {

template <typename F>
struct IsFuture : std::false_type {};

template <typename T>
struct IsFuture<Future<T>> : std::true_type {
  using ValueType = T;
};

template <typename F>
concept SomeFuture = IsFuture<std::remove_cvref_t<F>>::value;

template <SomeFuture F>
using ValueOf = typename IsFuture<std::remove_cvref_t<F>>::ValueType;

}  // namespace affine::futures::traits
