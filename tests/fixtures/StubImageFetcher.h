// Stub fetcher for ImageCache tests.  Thread-safe: Fetch() runs on the
// cache worker.  Optionally blocks until released so tests can pile up
// concurrent requests for the same URL.

#ifndef REELKIT_TESTS_FIXTURES_STUB_IMAGE_FETCHER_H_
#define REELKIT_TESTS_FIXTURES_STUB_IMAGE_FETCHER_H_

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "reelkit/image/IImageCache.hpp"

namespace reelkit::tests::fixtures {

class StubImageFetcher : public reelkit::image::IImageFetcher {
 public:
  reelkit::image::FetchResult Fetch(const std::string& url) override {
    std::unique_lock<std::mutex> lock(mutex_);
    fetch_counts_[url]++;
    cv_.notify_all();
    cv_.wait(lock, [this] { return !gated_; });
    if (failing_.count(url) != 0) {
      return reelkit::image::FetchResult::Failure(
          reelkit::image::FetchError::kDecodeFailed, "undecodable: " + url);
    }
    auto image = std::make_shared<reelkit::image::DecodedImage>();
    image->width = 1;
    image->height = 1;
    image->rgba = {1, 2, 3, 4};
    return reelkit::image::FetchResult::Success(image);
  }

  void SetFailing(const std::string& url, bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
      failing_.insert(url);
    } else {
      failing_.erase(url);
    }
  }

  // While gated, Fetch() blocks after counting the request.
  void Gate() {
    std::lock_guard<std::mutex> lock(mutex_);
    gated_ = true;
  }
  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      gated_ = false;
    }
    cv_.notify_all();
  }

  // Blocks until url has been fetched at least n times.
  void WaitForFetches(const std::string& url, int n) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return fetch_counts_[url] >= n; });
  }

  int fetchCount(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_counts_[url];
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, int> fetch_counts_;
  std::set<std::string> failing_;
  bool gated_ = false;
};

}  // namespace reelkit::tests::fixtures

#endif  // REELKIT_TESTS_FIXTURES_STUB_IMAGE_FETCHER_H_
