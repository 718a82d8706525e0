#pragma once

namespace affine {

// Value type for producers which return nothing

struct Unit {
  bool operator==(const Unit&) const = default;
};

}  // namespace affine
