#pragma once

#include <expected>

#include <affine/result/types/error.hpp>

namespace affine {

template <typename T>
using Result = std::expected<T, Error>;

}  // namespace affine
