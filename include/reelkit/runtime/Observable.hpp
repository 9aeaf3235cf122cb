// Repository: Reelkit-playlist
// Component: Observable State
// Purpose: Continuously observed state fields and event signals.
//          Last value wins, duplicates are suppressed, and delivery happens
//          synchronously on the thread that calls Set()/Emit(), which for
//          controller state is the owner executor.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_RUNTIME_OBSERVABLE_HPP_
#define REELKIT_RUNTIME_OBSERVABLE_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace reelkit::runtime {

// Subscription unsubscribes on destruction.  Move-only.
// Safe to outlive the Observable/Signal it came from.
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> cancel)
      : cancel_(std::move(cancel)) {}
  ~Subscription() { Reset(); }

  Subscription(Subscription&& other) noexcept
      : cancel_(std::move(other.cancel_)) {
    other.cancel_ = nullptr;
  }
  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      Reset();
      cancel_ = std::move(other.cancel_);
      other.cancel_ = nullptr;
    }
    return *this;
  }
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Reset() {
    if (cancel_) {
      auto cancel = std::move(cancel_);
      cancel_ = nullptr;
      cancel();
    }
  }

  bool Active() const { return static_cast<bool>(cancel_); }

 private:
  std::function<void()> cancel_;
};

// Signal<Args...> is a multicast event with no stored value.
// Subscribe/unsubscribe/emit may race across threads; handlers run on the
// emitting thread, outside the internal lock.
template <typename... Args>
class Signal {
 public:
  using Handler = std::function<void(const Args&...)>;

  Signal() : state_(std::make_shared<State>()) {}

  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  [[nodiscard]] Subscription Subscribe(Handler handler) const {
    uint64_t id;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      id = state_->next_id++;
      state_->handlers[id] = std::move(handler);
    }
    std::weak_ptr<State> weak = state_;
    return Subscription([weak, id] {
      if (auto state = weak.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->handlers.erase(id);
      }
    });
  }

  void Emit(const Args&... args) const {
    // Snapshot so handlers may unsubscribe (or subscribe) while running.
    std::vector<Handler> snapshot;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      snapshot.reserve(state_->handlers.size());
      for (const auto& entry : state_->handlers) {
        snapshot.push_back(entry.second);
      }
    }
    for (const auto& handler : snapshot) handler(args...);
  }

  size_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->handlers.size();
  }

 private:
  struct State {
    std::mutex mutex;
    std::map<uint64_t, Handler> handlers;
    uint64_t next_id = 0;
  };
  std::shared_ptr<State> state_;
};

// ObservableValue<T> holds the latest value of one state field.
// Set() with a value equal to the current one notifies nobody.
template <typename T>
class ObservableValue {
 public:
  explicit ObservableValue(T initial = T{}) : value_(std::move(initial)) {}

  const T& Get() const { return value_; }

  // Returns true if the value changed (and subscribers were notified).
  bool Set(T value) {
    if (value == value_) return false;
    value_ = std::move(value);
    changed_.Emit(value_);
    return true;
  }

  // Handler is not invoked with the current value; call Get() for that.
  [[nodiscard]] Subscription Subscribe(
      std::function<void(const T&)> handler) const {
    return changed_.Subscribe(std::move(handler));
  }

 private:
  T value_;
  Signal<T> changed_;
};

}  // namespace reelkit::runtime

#endif  // REELKIT_RUNTIME_OBSERVABLE_HPP_
