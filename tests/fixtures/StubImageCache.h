// Stub image cache: requests are parked until the test completes them.
// No threads; completions run inline on the test thread.

#ifndef REELKIT_TESTS_FIXTURES_STUB_IMAGE_CACHE_H_
#define REELKIT_TESTS_FIXTURES_STUB_IMAGE_CACHE_H_

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "reelkit/image/IImageCache.hpp"

namespace reelkit::tests::fixtures {

class StubImageCache : public reelkit::image::IImageCache {
 public:
  void FetchAsync(const std::string& url, FetchCallback done) override {
    requests_.push_back(url);
    auto it = auto_results_.find(url);
    if (it != auto_results_.end()) {
      done(it->second);
      return;
    }
    pending_.emplace_back(url, std::move(done));
  }

  std::shared_ptr<const reelkit::image::DecodedImage> Peek(
      const std::string& url) const override {
    auto it = auto_results_.find(url);
    if (it == auto_results_.end() || !it->second.ok()) return nullptr;
    return it->second.image;
  }

  // Every later request for url completes inline with result.
  void SetAutoResult(const std::string& url,
                     reelkit::image::FetchResult result) {
    auto_results_[url] = std::move(result);
  }

  void SetAutoSuccess(const std::string& url) {
    SetAutoResult(url, reelkit::image::FetchResult::Success(MakeImage()));
  }

  void SetAutoFailure(const std::string& url) {
    SetAutoResult(url, reelkit::image::FetchResult::Failure(
                           reelkit::image::FetchError::kNotFound,
                           "not found: " + url));
  }

  // Completes the oldest parked request for url.  Returns false if none.
  bool Complete(const std::string& url, reelkit::image::FetchResult result) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (it->first == url) {
        auto done = std::move(it->second);
        pending_.erase(it);
        done(result);
        return true;
      }
    }
    return false;
  }

  bool CompleteSuccess(const std::string& url) {
    return Complete(url, reelkit::image::FetchResult::Success(MakeImage()));
  }

  size_t pendingCount() const { return pending_.size(); }
  const std::vector<std::string>& requests() const { return requests_; }

  static std::shared_ptr<const reelkit::image::DecodedImage> MakeImage() {
    auto image = std::make_shared<reelkit::image::DecodedImage>();
    image->width = 2;
    image->height = 2;
    image->rgba.assign(16, 0xFF);
    return image;
  }

 private:
  std::map<std::string, reelkit::image::FetchResult> auto_results_;
  std::vector<std::pair<std::string, FetchCallback>> pending_;
  std::vector<std::string> requests_;
};

}  // namespace reelkit::tests::fixtures

#endif  // REELKIT_TESTS_FIXTURES_STUB_IMAGE_CACHE_H_
