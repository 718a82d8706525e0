#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstdint>

namespace affine::threads::lockfree {

// Monotonic 64-bit counter

class Counter {
 public:
  void Increment() {
    value_.fetch_add(1, std::memory_order::relaxed);
  }

  uint64_t Value() const {
    return value_.load(std::memory_order::relaxed);
  }

 private:
  twist::ed::stdlike::atomic<uint64_t> value_{0};
};

}  // namespace affine::threads::lockfree
