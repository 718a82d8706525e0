#pragma once

#include <affine/result/types/error.hpp>

#include <exception>

namespace affine::cancel {

// Stored in the Error of a handle which was cancelled by its timeout

struct CancelledException : public std::exception {
  const char* what() const noexcept override {
    return "affine: operation cancelled";
  }
};

inline Error CancelledError() {
  return std::make_exception_ptr(CancelledException{});
}

}  // namespace affine::cancel
