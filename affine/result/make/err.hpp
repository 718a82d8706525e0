#pragma once

#include <affine/result/types/result.hpp>

#include <stdexcept>
#include <utility>

namespace affine::result {

/*
 *
 * Usage:
 *
 * Result<int> r = result::Err(std::make_exception_ptr(std::runtime_error{"boom"}));
 *
 */

inline auto Err(Error error) {
  return std::unexpected(std::move(error));
}

// Rethrows the stored exception or returns the value

template <typename T>
T Unwrap(Result<T> result) {
  if (!result.has_value()) {
    std::rethrow_exception(result.error());
  }
  return std::move(*result);
}

}  // namespace affine::result
