#pragma once

#include <affine/executors/task.hpp>

#include <affine/futures/detail/shared_state.hpp>
#include <affine/futures/future.hpp>

#include <affine/timers/processor.hpp>

#include <function2/function2.hpp>

#include <exception>
#include <utility>
#include <variant>

namespace affine::executors {

// One submitted producer + its timeout + the producer side of its handle
//
// The producer shape is fixed at submission by the Execute overload:
//  - value producer: T()
//  - suspending producer: Future<T>(), awaited on the worker thread

template <typename T>
class WorkItem final : public WorkItemBase {
 public:
  using ValueProducer = fu2::unique_function<T()>;
  using SuspendingProducer = fu2::unique_function<futures::Future<T>()>;
  using Producer = std::variant<ValueProducer, SuspendingProducer>;

  using SharedState = futures::detail::SharedState<T>;

  WorkItem(Producer producer, timers::Millis timeout)
      : producer_(std::move(producer)),
        state_(new SharedState{}),
        timer_(timeout, state_) {
  }

  // Non-copyable
  WorkItem(const WorkItem&) = delete;
  WorkItem& operator=(const WorkItem&) = delete;

  ~WorkItem() override {
    state_->ReleaseRef();
  }

  // At most once, before the item is submitted
  futures::Future<T> MakeFuture() {
    return futures::Future<T>{state_};
  }

  // IWorkItem
  futures::State Run(timers::IProcessor* timeouts) noexcept override {
    const bool armed = ArmTimeout(timeouts);

    try {
      Produce();
    } catch (...) {
      state_->TrySetError(std::current_exception());
    }

    if (armed) {
      // Returns only after a racing expiry has published Cancelled
      timeouts->CancelTimer(&timer_);
    }

    futures::State outcome = state_->Peek();
    delete this;
    return outcome;
  }

  void Discard() noexcept override {
    state_->TryCancel();
    delete this;
  }

 private:
  static constexpr size_t kValue = 0;
  static constexpr size_t kSuspending = 1;

  class TimeoutTimer final : public timers::TimerBase {
   public:
    TimeoutTimer(timers::Millis delay, SharedState* state)
        : delay_(delay),
          state_(state) {
    }

    timers::Millis GetDelay() override {
      return delay_;
    }

    void Run() noexcept override {
      state_->TryCancel();
    }

   private:
    const timers::Millis delay_;
    SharedState* state_;
  };

  // true iff timer_ was handed to timeouts
  bool ArmTimeout(timers::IProcessor* timeouts) {
    if (timeouts == nullptr) {
      return false;
    }

    // Expires right after dequeue, the producer still runs
    if (timer_.GetDelay() == timers::Millis::zero()) {
      state_->TryCancel();
      return false;
    }

    timeouts->AddTimer(&timer_);
    return true;
  }

  void Produce() {
    switch (producer_.index()) {
      case kValue: {
        state_->TrySetValue(std::get<kValue>(producer_)());
        break;
      }
      case kSuspending: {
        futures::Future<T> inner = std::get<kSuspending>(producer_)();

        if (inner.Wait() == futures::State::Cancelled) {
          state_->TryCancel();
          break;
        }

        Result<T> result = std::move(inner).Get();
        if (result.has_value()) {
          state_->TrySetValue(std::move(*result));
        } else {
          state_->TrySetError(std::move(result.error()));
        }
        break;
      }
    }
  }

 private:
  Producer producer_;
  SharedState* state_;
  TimeoutTimer timer_;
};

}  // namespace affine::executors
