#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstdint>

namespace affine::threads::lockfree {

// Intrusive reference counter, the last ReleaseRef deletes T

template <typename T>
class RefCounter {
 public:
  void AddRef(uint64_t count) {
    ref_count_.fetch_add(count, std::memory_order::relaxed);
  }

  void ReleaseRef() {
    if (ref_count_.fetch_sub(1, std::memory_order::acq_rel) == 1) {
      delete static_cast<T*>(this);
    }
  }

 protected:
  ~RefCounter() = default;

 private:
  twist::ed::stdlike::atomic<uint64_t> ref_count_{0};
};

}  // namespace affine::threads::lockfree
