#include <affine/executors/observable.hpp>

namespace affine::executors {

ObservableExecutor::ObservableExecutor(IExecutor& underlying)
    : underlying_(underlying) {
}

void ObservableExecutor::Submit(WorkItemBase* item) {
  underlying_.Submit(item);
  // Counted once the underlying executor accepted the item
  submissions_.Increment();
}

bool ObservableExecutor::Dispose(timers::Millis grace) {
  return underlying_.Dispose(grace);
}

}  // namespace affine::executors
