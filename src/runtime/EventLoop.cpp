// Repository: Reelkit-playlist
// Component: Event Loop Implementation
// Copyright (c) 2025 RetroVue

#include "reelkit/runtime/EventLoop.hpp"

#include <future>
#include <memory>

#include "reelkit/util/Logger.hpp"

namespace reelkit::runtime {

using reelkit::util::Logger;
using reelkit::util::LogLine;

EventLoop::EventLoop(std::string name) : name_(std::move(name)) {
  std::promise<void> started;
  auto started_future = started.get_future();
  thread_ = std::thread([this, &started] {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      thread_id_ = std::this_thread::get_id();
    }
    started.set_value();
    Run();
  });
  started_future.wait();
}

EventLoop::~EventLoop() {
  Stop();
}

void EventLoop::Post(Task task) {
  Enqueue(std::chrono::steady_clock::now(), std::move(task));
}

void EventLoop::PostDelayed(std::chrono::milliseconds delay, Task task) {
  Enqueue(std::chrono::steady_clock::now() + delay, std::move(task));
}

bool EventLoop::RunsTasksOnCurrentThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::this_thread::get_id() == thread_id_;
}

bool EventLoop::InvokeAndWait(const Task& task) {
  if (RunsTasksOnCurrentThread()) {
    task();
    return true;
  }
  if (shutdown_.load(std::memory_order_acquire)) return false;

  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  Post([task, done] {
    task();
    done->set_value();
  });

  // A stopped loop drops the task; the promise is then destroyed unset.
  while (future.wait_for(std::chrono::milliseconds(50)) !=
         std::future_status::ready) {
    if (shutdown_.load(std::memory_order_acquire)) return false;
  }
  try {
    future.get();
  } catch (const std::future_error&) {
    return false;
  }
  return true;
}

void EventLoop::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
  if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
    thread_.join();
  }
}

size_t EventLoop::PendingTaskCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void EventLoop::Enqueue(std::chrono::steady_clock::time_point deadline,
                        Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return;
    queue_.push(Entry{deadline, next_sequence_++, std::move(task)});
  }
  cv_.notify_one();
}

void EventLoop::Run() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      while (true) {
        if (shutdown_.load(std::memory_order_acquire)) {
          Logger::Debug(LogLine("EventLoop", "STOPPED")
                            .Kv("name", name_)
                            .Kv("dropped", queue_.size())
                            .Str());
          return;
        }
        if (queue_.empty()) {
          cv_.wait(lock);
          continue;
        }
        auto deadline = queue_.top().deadline;
        if (std::chrono::steady_clock::now() >= deadline) break;
        cv_.wait_until(lock, deadline);
      }
      // priority_queue::top() is const; the entry is popped right after.
      task = std::move(const_cast<Entry&>(queue_.top()).task);
      queue_.pop();
    }
    if (task) task();
  }
}

}  // namespace reelkit::runtime
