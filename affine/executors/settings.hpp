#pragma once

#include <affine/support/debugger.hpp>

#include <affine/timers/millis.hpp>

#include <function2/function2.hpp>

#include <chrono>
#include <utility>

namespace affine::executors {

enum class TimeoutPolicy {
  Enforce = 1,                // Always arm item timeouts
  SuppressUnderDebugger = 2,  // Don't cancel items paused by a human
  Suppress = 3                // Never arm item timeouts
};

inline const timers::Millis kDefaultGracePeriod = std::chrono::seconds{5};

inline const timers::Millis kDefaultProbeInterval{100};

// Launch settings of a WorkerThreadExecutor
//
// Usage:
//
// executors::WorkerThreadExecutor worker{
//     executors::WorkerSettings{}.SetGracePeriod(1s)};

struct WorkerSettings {
  using DebuggerProbe = fu2::function<bool()>;

  // How long the destructor waits for the worker thread
  timers::Millis grace_period{kDefaultGracePeriod};

  TimeoutPolicy timeout_policy{TimeoutPolicy::SuppressUnderDebugger};

  // Consulted under SuppressUnderDebugger, at most once per
  // probe_interval, the answer is reused in between
  DebuggerProbe debugger_probe{&support::DebuggerAttached};
  timers::Millis probe_interval{kDefaultProbeInterval};

  WorkerSettings& SetGracePeriod(timers::Millis grace) {
    grace_period = grace;
    return *this;
  }

  WorkerSettings& SetTimeoutPolicy(TimeoutPolicy policy) {
    timeout_policy = policy;
    return *this;
  }

  WorkerSettings& SetDebuggerProbe(DebuggerProbe probe) {
    debugger_probe = std::move(probe);
    return *this;
  }

  WorkerSettings& SetProbeInterval(timers::Millis interval) {
    probe_interval = interval;
    return *this;
  }
};

}  // namespace affine::executors
