#pragma once

#include <chrono>

namespace affine::timers {

using Millis = std::chrono::milliseconds;

// Rounds up: a timer never fires before its delay has elapsed
template <typename Duration>
inline Millis ToMillis(Duration dur) {
  return std::chrono::ceil<Millis>(dur);
}

}  // namespace affine::timers
