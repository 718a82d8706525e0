#pragma once

#include <affine/satellite/logger.hpp>

#include <string>
#include <vector>

namespace affine::executors {

#if defined(__AFFINE_METRICS__)
inline const bool kCollectMetrics = true;
#else
inline const bool kCollectMetrics = false;
#endif

// Outcome names match futures::ToString
inline const std::vector<std::string> kMetrics{"Executed",  "Resolved",
                                               "Failed",    "Cancelled",
                                               "Discarded"};

using Logger = satellite::Logger<kCollectMetrics>;

}  // namespace affine::executors
