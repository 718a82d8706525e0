#pragma once

#include <affine/threads/blocking/stdlike/condition_variable.hpp>
#include <affine/threads/blocking/stdlike/mutex.hpp>

#include <wheels/intrusive/list.hpp>

#include <cstddef>
#include <mutex>

namespace affine::executors {

// Unbounded blocking multi-producer/single-consumer FIFO queue

template <typename T>
class WorkQueue {
 public:
  // false iff the queue was closed, object is not taken then
  bool Put(T* object) {
    std::lock_guard lock(mutex_);

    if (closed_) {
      return false;
    }

    items_.PushBack(object);

    // Consumer only ever sleeps on an empty queue
    if (++size_ == 1) {
      not_empty_.NotifyOne();
    }

    return true;
  }

  // Blocks while the queue is open and empty
  // Objects put before Close are still handed out,
  // nullptr iff the queue is closed and drained
  T* Take() {
    std::unique_lock lock(mutex_);

    while (!closed_ && items_.IsEmpty()) {
      not_empty_.Wait(lock);
    }

    if (items_.IsEmpty()) {
      return nullptr;
    }

    --size_;
    return items_.PopFront();
  }

  // Wakes the consumer
  void Close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    not_empty_.NotifyAll();
  }

  wheels::IntrusiveList<T> TakeAll() {
    std::lock_guard lock(mutex_);

    wheels::IntrusiveList<T> all;
    while (T* object = items_.PopFront()) {
      all.PushBack(object);
    }
    size_ = 0;

    return all;
  }

  size_t Size() {
    std::lock_guard lock(mutex_);
    return size_;
  }

  bool IsClosed() {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  threads::blocking::stdlike::Mutex mutex_;
  threads::blocking::stdlike::CondVar not_empty_;
  wheels::IntrusiveList<T> items_;  // guarded by mutex_
  size_t size_{0};                  // guarded by mutex_
  bool closed_{false};              // guarded by mutex_
};

}  // namespace affine::executors
