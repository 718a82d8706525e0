#include <affine/executors/execute.hpp>
#include <affine/executors/observable.hpp>
#include <affine/executors/worker_thread.hpp>

#include <affine/futures/contract.hpp>

#include <affine/cancel/cancelled.hpp>

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using namespace affine;  // NOLINT

//////////////////////////////////////////////////////////////////////
/*
WorkerThreadExecutor runs work items one at a time on a single
dedicated thread, in the order they were submitted.

Work is submitted with executors::Execute, every item carries its own
timeout. The result is delivered through futures::Future<T>.
*/

//////////////////////////////////////////////////////////////////////

template <typename T>
void Report(const char* what, futures::Future<T> f) {
  auto state = f.Wait();
  auto result = std::move(f).Get();

  if (result) {
    fmt::print("{}: {}\n", what, futures::ToString(state));
    return;
  }

  try {
    std::rethrow_exception(result.error());
  } catch (const cancel::CancelledException&) {
    fmt::print("{}: cancelled\n", what);
  } catch (const std::exception& e) {
    fmt::print("{}: failed with '{}'\n", what, e.what());
  }
}

void ValuesExample(executors::IExecutor& exe) {
  fmt::print("Values Example\n");

  auto f = executors::Execute(exe, [] {
    return std::string{"Hello from the worker"};
  }, 1s);

  fmt::print("{}\n", *std::move(f).Get());

  // Void producers complete with Unit
  Report("Void", executors::Execute(exe, [] {}, 1s));

  Report("Throwing", executors::Execute(exe, []() -> int {
    throw std::runtime_error("boom");
  }, 1s));
}

//////////////////////////////////////////////////////////////////////

void TimeoutExample(executors::IExecutor& exe) {
  fmt::print("Timeout Example\n");

  // The caller observes the cancellation after ~100ms,
  // the worker is busy for the whole 300ms anyway
  Report("Slow", executors::Execute(exe, [] {
    std::this_thread::sleep_for(300ms);
    return 1;
  }, 100ms));
}

//////////////////////////////////////////////////////////////////////

void SuspendingExample(executors::IExecutor& exe) {
  fmt::print("Suspending Example\n");

  auto [inner, p] = futures::Contract<int>();

  std::thread io([p = std::move(p)]() mutable {
    std::this_thread::sleep_for(50ms);
    std::move(p).SetValue(42);
  });

  // The worker awaits the returned future before taking the next item
  auto f = executors::Execute(exe, [inner = std::move(inner)]() mutable {
    return std::move(inner);
  }, 1s);

  fmt::print("Unwrapped: {}\n", *std::move(f).Get());

  io.join();
}

//////////////////////////////////////////////////////////////////////

int main() {
  executors::WorkerThreadExecutor worker{
      executors::WorkerSettings{}.SetGracePeriod(1s)};

  // Counts everything submitted through it
  executors::ObservableExecutor observable{worker};

  ValuesExample(observable);
  TimeoutExample(observable);
  SuspendingExample(observable);

  fmt::print("Submitted: {}\n", observable.SubmissionCount());

  if (!observable.Dispose(1s)) {
    fmt::print("Worker did not stop in time\n");
  }

  worker.Metrics().Print();

  return 0;
}
