// Repository: Reelkit-playlist
// Component: Image Cache Implementation
// Copyright (c) 2025 RetroVue

#include "reelkit/image/ImageCache.hpp"

#include <stdexcept>

#include "reelkit/util/Logger.hpp"

namespace reelkit::image {

using reelkit::util::Logger;
using reelkit::util::LogLine;

const char* FetchErrorName(FetchError error) {
  switch (error) {
    case FetchError::kNone:         return "none";
    case FetchError::kNotFound:     return "not_found";
    case FetchError::kDecodeFailed: return "decode_failed";
    case FetchError::kShutdown:     return "shutdown";
  }
  return "unknown";
}

ImageCache::ImageCache(std::shared_ptr<IImageFetcher> fetcher, size_t capacity)
    : fetcher_(std::move(fetcher)), capacity_(capacity == 0 ? 1 : capacity) {
  if (!fetcher_) {
    throw std::invalid_argument("ImageCache requires a fetcher");
  }
  worker_thread_ = std::thread(&ImageCache::WorkerLoop, this);
}

ImageCache::~ImageCache() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  // Anything still queued never ran.
  std::unordered_map<std::string, std::vector<FetchCallback>> orphaned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    orphaned.swap(waiters_);
    queue_.clear();
  }
  for (auto& [url, callbacks] : orphaned) {
    const auto result =
        FetchResult::Failure(FetchError::kShutdown, "image cache stopped");
    for (auto& cb : callbacks) cb(result);
  }
}

void ImageCache::FetchAsync(const std::string& url, FetchCallback done) {
  std::shared_ptr<const DecodedImage> hit;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(url);
    if (it != index_.end()) {
      lru_.splice(lru_.begin(), lru_, it->second);
      hit = it->second->second;
    } else if (!shutdown_.load(std::memory_order_acquire)) {
      auto& waiting = waiters_[url];
      const bool first = waiting.empty();
      waiting.push_back(std::move(done));
      if (first) queue_.push_back(url);
      misses_.fetch_add(1, std::memory_order_relaxed);
      if (first) work_cv_.notify_one();
      return;
    }
  }

  if (hit) {
    hits_.fetch_add(1, std::memory_order_relaxed);
    done(FetchResult::Success(std::move(hit)));
    return;
  }
  done(FetchResult::Failure(FetchError::kShutdown, "image cache stopped"));
}

std::shared_ptr<const DecodedImage> ImageCache::Peek(
    const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(url);
  if (it == index_.end()) return nullptr;
  return it->second->second;
}

void ImageCache::Put(const std::string& url,
                     std::shared_ptr<const DecodedImage> image) {
  if (!image) return;
  std::lock_guard<std::mutex> lock(mutex_);
  InsertLocked(url, std::move(image));
}

void ImageCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lru_.clear();
  index_.clear();
}

size_t ImageCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

bool ImageCache::HasPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !waiters_.empty();
}

void ImageCache::SetDelayHook(DelayHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_hook_ = std::move(hook);
}

void ImageCache::InsertLocked(const std::string& url,
                              std::shared_ptr<const DecodedImage> image) {
  auto it = index_.find(url);
  if (it != index_.end()) {
    it->second->second = std::move(image);
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }
  lru_.emplace_front(url, std::move(image));
  index_[url] = lru_.begin();
  while (lru_.size() > capacity_) {
    Logger::Debug(LogLine("ImageCache", "EVICT")
                      .Kv("url", lru_.back().first)
                      .Str());
    index_.erase(lru_.back().first);
    lru_.pop_back();
  }
}

// =============================================================================
// WorkerLoop: persistent thread, one fetch at a time
// =============================================================================

void ImageCache::WorkerLoop() {
  while (true) {
    std::string url;
    DelayHookFn hook;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });
      if (shutdown_.load(std::memory_order_acquire)) return;

      url = std::move(queue_.front());
      queue_.pop_front();
      hook = delay_hook_;
    }

    if (hook) hook(url);

    FetchResult result = fetcher_->Fetch(url);
    if (!result.ok() && result.error == FetchError::kNone) {
      result.error = FetchError::kDecodeFailed;
    }

    std::vector<FetchCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (result.ok()) InsertLocked(url, result.image);
      auto it = waiters_.find(url);
      if (it != waiters_.end()) {
        callbacks = std::move(it->second);
        waiters_.erase(it);
      }
    }

    if (!result.ok()) {
      Logger::Warn(LogLine("ImageCache", "FETCH_FAILED")
                       .Kv("url", url)
                       .Kv("error", FetchErrorName(result.error))
                       .Kv("message", result.message)
                       .Str());
    }
    for (auto& cb : callbacks) cb(result);
  }
}

}  // namespace reelkit::image
