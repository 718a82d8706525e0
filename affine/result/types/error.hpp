#pragma once

#include <exception>

namespace affine {

// Exception thrown by a producer, transported to the submitter as is

using Error = std::exception_ptr;

}  // namespace affine
