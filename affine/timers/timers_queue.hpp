#pragma once

#include <affine/timers/timer.hpp>

#include <wheels/intrusive/list.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>
#include <vector>

namespace affine::timers {

// Min-heap of pending timers ordered by deadline
// Not synchronized, guarded by the owning processor

class TimersQueue {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  void Push(TimerBase* timer, TimePoint now) {
    timer->deadline = now + timer->GetDelay();

    heap_.push_back(timer);
    std::push_heap(heap_.begin(), heap_.end(), kLater);
  }

  // false if timer is not in the queue (already fired or never added)
  bool Remove(TimerBase* timer) {
    auto it = std::find(heap_.begin(), heap_.end(), timer);
    if (it == heap_.end()) {
      return false;
    }

    heap_.erase(it);
    std::make_heap(heap_.begin(), heap_.end(), kLater);
    return true;
  }

  // Expired timers in deadline order + time until the next deadline
  // (nullopt if queue was depleted)
  std::pair<wheels::IntrusiveList<TimerBase>, std::optional<Millis>>
  GrabReadyTimers(TimePoint now) {
    wheels::IntrusiveList<TimerBase> ready;
    std::optional<Millis> until_next = std::nullopt;

    while (!heap_.empty()) {
      TimerBase* next = heap_.front();

      if (next->deadline > now) {
        until_next.emplace(ToMillis(next->deadline - now));
        break;
      }

      std::pop_heap(heap_.begin(), heap_.end(), kLater);
      heap_.pop_back();

      ready.PushBack(next);
    }

    return {std::move(ready), until_next};
  }

  void Clear() {
    heap_.clear();
  }

  size_t Size() const {
    return heap_.size();
  }

  bool IsEmpty() const {
    return heap_.empty();
  }

 private:
  static constexpr auto kLater = [](TimerBase* lhs, TimerBase* rhs) {
    return lhs->deadline > rhs->deadline;
  };

 private:
  std::vector<TimerBase*> heap_{};
};

}  // namespace affine::timers
