// Repository: Reelkit-playlist
// Component: Image Cache
// Purpose: Shared, bounded, recency-evicting store of decoded images with a
//          persistent fetch worker.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_IMAGE_IMAGE_CACHE_HPP_
#define REELKIT_IMAGE_IMAGE_CACHE_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "reelkit/image/IImageCache.hpp"

namespace reelkit::image {

// ImageCache: persistent worker thread in front of an IImageFetcher.
//
// - Hits complete inline and refresh recency.
// - Concurrent requests for the same URL share one fetch.
// - Successful fetches are inserted; the least recently used entry is
//   evicted past capacity.  Failures are not cached.
// - Last write wins per key.
//
// One instance per process, injected wherever images are needed.
class ImageCache : public IImageCache {
 public:
  using DelayHookFn = std::function<void(const std::string& url)>;

  ImageCache(std::shared_ptr<IImageFetcher> fetcher, size_t capacity);
  ~ImageCache() override;

  ImageCache(const ImageCache&) = delete;
  ImageCache& operator=(const ImageCache&) = delete;

  void FetchAsync(const std::string& url, FetchCallback done) override;
  std::shared_ptr<const DecodedImage> Peek(
      const std::string& url) const override;

  // Inserts (or replaces) url directly.
  void Put(const std::string& url, std::shared_ptr<const DecodedImage> image);

  void Clear();

  size_t Size() const;
  size_t Capacity() const { return capacity_; }
  bool HasPending() const;
  uint64_t HitCount() const { return hits_.load(std::memory_order_relaxed); }
  uint64_t MissCount() const { return misses_.load(std::memory_order_relaxed); }

  // Test-only: runs on the worker before each fetch.
  void SetDelayHook(DelayHookFn hook);

 private:
  using Entry = std::pair<std::string, std::shared_ptr<const DecodedImage>>;

  void WorkerLoop();
  void InsertLocked(const std::string& url,
                    std::shared_ptr<const DecodedImage> image);

  std::shared_ptr<IImageFetcher> fetcher_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;

  // Front = most recently used.
  std::list<Entry> lru_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;

  // Requests waiting for the worker, and the callbacks per in-flight URL.
  std::deque<std::string> queue_;
  std::unordered_map<std::string, std::vector<FetchCallback>> waiters_;

  std::thread worker_thread_;
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};

  DelayHookFn delay_hook_;  // Test-only
};

}  // namespace reelkit::image

#endif  // REELKIT_IMAGE_IMAGE_CACHE_HPP_
