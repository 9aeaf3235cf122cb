// Repository: Reelkit-playlist
// Component: Event Loop
// Purpose: Production IExecutor: one persistent thread draining a
//          deadline-ordered task queue.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_RUNTIME_EVENT_LOOP_HPP_
#define REELKIT_RUNTIME_EVENT_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "reelkit/runtime/IExecutor.hpp"

namespace reelkit::runtime {

// EventLoop owns a worker thread that runs posted tasks in deadline order.
//
// Lifecycle:
//   1. Construct (thread starts immediately)
//   2. Post()/PostDelayed() from any thread
//   3. Stop() or destructor: pending tasks are dropped, running task finishes
//
// InvokeAndWait() runs a task on the loop and blocks the caller until it
// returns.  Called from the loop thread itself it runs inline.
class EventLoop : public IExecutor {
 public:
  explicit EventLoop(std::string name = "EventLoop");
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Post(Task task) override;
  void PostDelayed(std::chrono::milliseconds delay, Task task) override;
  bool RunsTasksOnCurrentThread() const override;

  // Blocks until task has run.  Returns false if the loop is stopped.
  bool InvokeAndWait(const Task& task);

  // Idempotent.  Joins the worker thread.
  void Stop();

  bool IsRunning() const { return !shutdown_.load(std::memory_order_acquire); }

  // Number of tasks waiting (due or not).
  size_t PendingTaskCount() const;

 private:
  struct Entry {
    std::chrono::steady_clock::time_point deadline;
    uint64_t sequence;
    Task task;
  };
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.deadline != b.deadline) return a.deadline > b.deadline;
      return a.sequence > b.sequence;
    }
  };

  void Enqueue(std::chrono::steady_clock::time_point deadline, Task task);
  void Run();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  uint64_t next_sequence_ = 0;
  std::atomic<bool> shutdown_{false};
  std::thread thread_;
  std::thread::id thread_id_;
};

}  // namespace reelkit::runtime

#endif  // REELKIT_RUNTIME_EVENT_LOOP_HPP_
