#pragma once

#include <affine/futures/state.hpp>

#include <affine/timers/processor.hpp>

#include <wheels/intrusive/list.hpp>

namespace affine::executors {

struct IWorkItem {
  virtual ~IWorkItem() = default;

  // Runs the producer on the calling (worker) thread and resolves the
  // item's handle. timeouts == nullptr disables the item's timeout.
  // Destroys the item, returns the terminal state of its handle
  virtual futures::State Run(timers::IProcessor* timeouts) noexcept = 0;

  // Cancels the handle without running the producer, destroys the item
  virtual void Discard() noexcept = 0;
};

struct WorkItemBase : public IWorkItem,
                      public wheels::IntrusiveListNode<WorkItemBase> {};

}  // namespace affine::executors
