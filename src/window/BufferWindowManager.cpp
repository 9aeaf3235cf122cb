// Repository: Reelkit-playlist
// Component: Buffer Window Manager
// Purpose: Slot rotation, resize, and focus policy for the renderer pool.
// Copyright (c) 2025 RetroVue

#include "reelkit/window/BufferWindowManager.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <stdexcept>

#include "reelkit/telemetry/PlaylistMetrics.hpp"
#include "reelkit/util/Logger.hpp"

namespace reelkit::window {

using playlist::Behavior;
using playlist::PlaylistItem;
using reelkit::util::Logger;
using reelkit::util::LogLine;

const char* WindowSyncKindName(WindowSyncResult::Kind kind) {
  switch (kind) {
    case WindowSyncResult::Kind::kUnchanged:  return "UNCHANGED";
    case WindowSyncResult::Kind::kRotated:    return "ROTATED";
    case WindowSyncResult::Kind::kInPlace:    return "IN_PLACE";
    case WindowSyncResult::Kind::kFullRebind: return "FULL_REBIND";
  }
  return "UNKNOWN";
}

BufferWindowManager::BufferWindowManager(const Dependencies& deps,
                                         const config::PlaylistConfig& config,
                                         const playlist::PlaylistStore* store,
                                         int32_t backward_buffer,
                                         int32_t forward_buffer)
    : executor_(deps.executor),
      factory_(deps.renderer_factory),
      store_(store),
      backward_(std::max(0, backward_buffer)),
      forward_(std::max(0, forward_buffer)) {
  if (executor_ == nullptr) {
    throw std::invalid_argument("BufferWindowManager requires an executor");
  }
  if (factory_ == nullptr) {
    throw std::invalid_argument(
        "BufferWindowManager requires a renderer factory");
  }
  if (store_ == nullptr) {
    throw std::invalid_argument("BufferWindowManager requires a store");
  }

  context_.executor = deps.executor;
  context_.image_cache = deps.image_cache;
  context_.notifier = deps.notifier;
  context_.metrics = deps.metrics;
  context_.config = config;

  const int32_t size = backward_ + forward_ + 1;
  slots_.reserve(static_cast<size_t>(size));
  for (int32_t i = 0; i < size; ++i) {
    slots_.push_back(MakeSlot());
  }
  UpdateGauges();

  Logger::Info(LogLine("BufferWindowManager", "POOL_CREATED")
                   .Kv("backward", backward_)
                   .Kv("forward", forward_)
                   .Kv("slots", size)
                   .Str());
}

BufferWindowManager::~BufferWindowManager() {
  for (auto& slot : slots_) {
    slot->SetOnChanged(nullptr);
    slot->SetOnEnded(nullptr);
  }
  last_current_ = nullptr;
  slots_.clear();
}

std::shared_ptr<RendererSlot> BufferWindowManager::MakeSlot() {
  auto renderer = factory_->CreateRenderer();
  auto slot = RendererSlot::Create(next_slot_id_++, std::move(renderer),
                                   &context_);
  WireSlot(slot);
  return slot;
}

void BufferWindowManager::WireSlot(const std::shared_ptr<RendererSlot>& slot) {
  slot->SetOnChanged([this](RendererSlot& s) { OnSlotChanged(s); });
  slot->SetOnEnded([this](RendererSlot& s) { OnSlotEnded(s); });
}

RendererSlot* BufferWindowManager::CurrentSlot() const {
  if (static_cast<size_t>(backward_) >= slots_.size()) return nullptr;
  return slots_[static_cast<size_t>(backward_)].get();
}

bool BufferWindowManager::IsCurrent(const RendererSlot& slot) const {
  return CurrentSlot() == &slot;
}

// =============================================================================
// Window shift
// =============================================================================

std::optional<int32_t> BufferWindowManager::FindAnchorDiff(
    const std::vector<std::optional<PlaylistItem>>& window) const {
  // diff -> number of slots that line up under it
  std::map<int32_t, int32_t> votes;
  for (size_t i = 0; i < slots_.size(); ++i) {
    const auto& bound = slots_[i]->BoundItem();
    if (!bound) continue;
    for (size_t j = 0; j < window.size(); ++j) {
      if (window[j] && *window[j] == *bound) {
        votes[static_cast<int32_t>(i) - static_cast<int32_t>(j)]++;
      }
    }
  }
  if (votes.empty()) return std::nullopt;

  auto best = votes.begin();
  for (auto it = votes.begin(); it != votes.end(); ++it) {
    if (it->second > best->second ||
        (it->second == best->second &&
         std::abs(it->first) < std::abs(best->first))) {
      best = it;
    }
  }
  return best->first;
}

WindowSyncResult BufferWindowManager::SyncWindow(bool focused) {
  WindowSyncResult result;
  const auto window = store_->RangedItems(backward_, forward_);
  const int32_t size = static_cast<int32_t>(slots_.size());

  const bool had_bindings = std::any_of(
      slots_.begin(), slots_.end(),
      [](const auto& s) { return s->BoundItem().has_value(); });
  const bool window_has_items = std::any_of(
      window.begin(), window.end(), [](const auto& w) { return w.has_value(); });

  const auto diff = FindAnchorDiff(window);
  if (diff && *diff != 0) {
    result.diff = *diff;
    if (*diff > 0) {
      std::rotate(slots_.begin(), slots_.begin() + *diff, slots_.end());
    } else {
      std::rotate(slots_.begin(), slots_.end() + *diff, slots_.end());
    }
  }

  for (int32_t pos = 0; pos < size; ++pos) {
    auto& slot = slots_[static_cast<size_t>(pos)];
    const auto& target = window[static_cast<size_t>(pos)];
    const bool wanted = target.has_value() && (pos == backward_ || focused);
    if (wanted) {
      if (slot->Prepare(*target)) result.rebinds++;
    } else if (slot->BoundItem()) {
      slot->Clear();
      result.clears++;
    }
  }

  // A debounced item replacement can move a playing item off the current
  // position without an index change.
  for (int32_t pos = 0; pos < size; ++pos) {
    auto& slot = slots_[static_cast<size_t>(pos)];
    if (pos != backward_ && slot->IsPlaying()) {
      Logger::Debug(LogLine("BufferWindowManager", "NONCURRENT_PAUSED")
                        .Kv("slot", slot->SlotId())
                        .Kv("pos", pos)
                        .Str());
      slot->Rewind();
    }
  }

  if (!diff && had_bindings && window_has_items) {
    result.kind = WindowSyncResult::Kind::kFullRebind;
  } else if (result.diff != 0) {
    result.kind = WindowSyncResult::Kind::kRotated;
  } else if (result.rebinds > 0 || result.clears > 0) {
    result.kind = WindowSyncResult::Kind::kInPlace;
  }

  if (context_.metrics) {
    auto& m = *context_.metrics;
    if (result.kind == WindowSyncResult::Kind::kRotated) {
      m.window_shifts_total++;
      m.rotations_total++;
    } else if (result.kind == WindowSyncResult::Kind::kFullRebind) {
      m.window_shifts_total++;
      m.full_rebinds_total++;
    }
  }

  if (result.kind == WindowSyncResult::Kind::kRotated ||
      result.kind == WindowSyncResult::Kind::kFullRebind) {
    Logger::Info(LogLine("BufferWindowManager", "WINDOW_SHIFT")
                     .Kv("kind", WindowSyncKindName(result.kind))
                     .Kv("index", store_->CurrentIndex())
                     .Kv("diff", result.diff)
                     .Kv("rebinds", result.rebinds)
                     .Kv("clears", result.clears)
                     .Kv("focused", focused)
                     .Str());
  } else if (result.kind == WindowSyncResult::Kind::kInPlace) {
    Logger::Debug(LogLine("BufferWindowManager", "WINDOW_REFRESH")
                      .Kv("index", store_->CurrentIndex())
                      .Kv("rebinds", result.rebinds)
                      .Kv("clears", result.clears)
                      .Str());
  }

  UpdateVisibility();
  UpdateGauges();

  RendererSlot* current = CurrentSlot();
  if (current != last_current_) {
    last_current_ = current;
    if (on_current_changed_) on_current_changed_();
  }
  return result;
}

void BufferWindowManager::RewindCurrent() {
  if (RendererSlot* current = CurrentSlot()) current->Rewind();
}

void BufferWindowManager::UpdateVisibility() {
  for (size_t i = 0; i < slots_.size(); ++i) {
    slots_[i]->SetVisible(static_cast<int32_t>(i) == backward_);
  }
}

void BufferWindowManager::UpdateGauges() {
  if (!context_.metrics) return;
  auto& m = *context_.metrics;
  m.pool_size = PoolSize();
  m.backward_buffer = backward_;
  m.forward_buffer = forward_;
  m.current_index = store_->CurrentIndex();
}

// =============================================================================
// Resize
// =============================================================================

bool BufferWindowManager::Resize(int32_t backward_buffer,
                                 int32_t forward_buffer, bool focused) {
  if (backward_buffer < 0 || forward_buffer < 0) return false;
  if (backward_buffer == backward_ && forward_buffer == forward_) return false;

  const int32_t head_delta = backward_buffer - backward_;
  const int32_t tail_delta = forward_buffer - forward_;

  if (head_delta > 0) {
    std::vector<std::shared_ptr<RendererSlot>> head;
    for (int32_t i = 0; i < head_delta; ++i) head.push_back(MakeSlot());
    slots_.insert(slots_.begin(), head.begin(), head.end());
  } else if (head_delta < 0) {
    const auto end = slots_.begin() + (-head_delta);
    for (auto it = slots_.begin(); it != end; ++it) (*it)->Clear();
    slots_.erase(slots_.begin(), end);
  }

  if (tail_delta > 0) {
    for (int32_t i = 0; i < tail_delta; ++i) slots_.push_back(MakeSlot());
  } else if (tail_delta < 0) {
    const auto begin = slots_.end() + tail_delta;
    for (auto it = begin; it != slots_.end(); ++it) (*it)->Clear();
    slots_.erase(begin, slots_.end());
  }

  Logger::Info(LogLine("BufferWindowManager", "POOL_RESIZED")
                   .Kv("backward", std::to_string(backward_) + "->" +
                                       std::to_string(backward_buffer))
                   .Kv("forward", std::to_string(forward_) + "->" +
                                      std::to_string(forward_buffer))
                   .Kv("slots", slots_.size())
                   .Str());

  backward_ = backward_buffer;
  forward_ = forward_buffer;
  if (context_.metrics) context_.metrics->pool_resizes_total++;

  SyncWindow(focused);
  return true;
}

// =============================================================================
// Focus
// =============================================================================

void BufferWindowManager::ApplyFocus(bool focused) {
  if (focused) {
    SyncWindow(true);
    return;
  }
  RendererSlot* current = CurrentSlot();
  int32_t cleared = 0;
  for (auto& slot : slots_) {
    if (slot.get() == current) continue;
    if (slot->BoundItem()) {
      slot->Clear();
      cleared++;
    }
  }
  if (current) current->Rewind();
  Logger::Info(LogLine("BufferWindowManager", "FOCUS_LOST")
                   .Kv("cleared", cleared)
                   .Str());
}

// =============================================================================
// Slot events
// =============================================================================

void BufferWindowManager::OnSlotChanged(RendererSlot& slot) {
  if (IsCurrent(slot) && on_current_changed_) on_current_changed_();
}

void BufferWindowManager::OnSlotEnded(RendererSlot& slot) {
  if (!IsCurrent(slot) || !slot.BoundItem()) return;
  const PlaylistItem item = *slot.BoundItem();

  bool replaying = false;
  switch (item.behavior.kind) {
    case Behavior::Kind::kLoop:
      replaying = true;
      break;
    case Behavior::Kind::kRepeat:
      replaying = slot.ReplayCount() < item.behavior.count;
      break;
    case Behavior::Kind::kPlayOnce:
      break;
  }

  if (replaying) {
    Logger::Debug(LogLine("BufferWindowManager", "ITEM_REPLAY")
                      .Kv("behavior", playlist::BehaviorName(item.behavior.kind))
                      .Kv("replay", slot.ReplayCount() + 1)
                      .Str());
    slot.Replay();
  }
  if (on_item_ended_) on_item_ended_(item, replaying);
}

void BufferWindowManager::ReplayCurrent() {
  RendererSlot* current = CurrentSlot();
  if (current && current->BoundItem()) current->Replay();
}

}  // namespace reelkit::window
