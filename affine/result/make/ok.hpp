#pragma once

#include <affine/result/types/result.hpp>
#include <affine/result/types/unit.hpp>

namespace affine::result {

/*
 * Usage:
 *
 * Result<int> r = result::Ok(42);
 *
 */

template <typename T>
Result<T> Ok(T value) {
  return {std::move(value)};
}

inline Result<Unit> Ok() {
  return {Unit{}};
}

}  // namespace affine::result
