#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace affine::futures {

enum class State : uint32_t {
  Pending = 0,
  Resolved = 2,
  Failed = 3,
  Cancelled = 4,
};

inline std::string_view ToString(State state) {
  switch (state) {
    case State::Pending:
      return "Pending";
    case State::Resolved:
      return "Resolved";
    case State::Failed:
      return "Failed";
    case State::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

inline std::ostream& operator<<(std::ostream& out, State state) {
  return out << ToString(state);
}

}  // namespace affine::futures
