// Repository: Reelkit-playlist
// Component: Executor Interface
// Purpose: The single owner context that serializes every playlist state
//          transition.  Asynchronous completions (image fetches, renderer
//          readiness) are posted here before they touch shared state.
//          Production: EventLoop (dedicated thread, real time).
//          Tests: ManualExecutor (virtual time, runs on the test thread).
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_RUNTIME_IEXECUTOR_HPP_
#define REELKIT_RUNTIME_IEXECUTOR_HPP_

#include <chrono>
#include <functional>

namespace reelkit::runtime {

class IExecutor {
 public:
  using Task = std::function<void()>;

  virtual ~IExecutor() = default;

  // Run task on the owner context, after every task already posted.
  virtual void Post(Task task) = 0;

  // Run task on the owner context no earlier than delay from now.
  // Tasks with equal deadlines run in posting order.
  virtual void PostDelayed(std::chrono::milliseconds delay, Task task) = 0;

  // True when called from the owner context itself.
  virtual bool RunsTasksOnCurrentThread() const = 0;
};

}  // namespace reelkit::runtime

#endif  // REELKIT_RUNTIME_IEXECUTOR_HPP_
