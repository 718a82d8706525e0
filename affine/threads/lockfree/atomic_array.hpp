#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstddef>
#include <type_traits>
#include <vector>

namespace affine::threads::lockfree {

// Fixed-size array of independent atomic counters

template <typename T>
requires std::is_integral_v<T>
class AtomicArray {
 private:
  struct Slot {
    twist::ed::stdlike::atomic<T> value{0};
  };

 public:
  explicit AtomicArray(size_t count)
      : slots_(count) {
  }

  T Load(size_t index,
         std::memory_order mo = std::memory_order::relaxed) const {
    return slots_[index].value.load(mo);
  }

  T FetchAdd(size_t index, T diff,
             std::memory_order mo = std::memory_order::relaxed) {
    return slots_[index].value.fetch_add(diff, mo);
  }

  size_t Size() const {
    return slots_.size();
  }

 private:
  std::vector<Slot> slots_;
};

}  // namespace affine::threads::lockfree
