// Repository: Reelkit-playlist
// Component: Image Fetch Interfaces
// Purpose: fetch(url) -> image | failure, with a bounded cache in front.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_IMAGE_IIMAGE_CACHE_HPP_
#define REELKIT_IMAGE_IIMAGE_CACHE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace reelkit::image {

// Tightly packed RGBA8, row-major.
struct DecodedImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;
};

enum class FetchError {
  kNone = 0,
  kNotFound,      // Could not open the URL
  kDecodeFailed,  // Opened but no decodable picture
  kShutdown,      // Cache stopped before the request ran
};

const char* FetchErrorName(FetchError error);

struct FetchResult {
  std::shared_ptr<const DecodedImage> image;
  FetchError error = FetchError::kNone;
  std::string message;

  bool ok() const { return error == FetchError::kNone && image != nullptr; }

  static FetchResult Success(std::shared_ptr<const DecodedImage> img) {
    return FetchResult{std::move(img), FetchError::kNone, {}};
  }
  static FetchResult Failure(FetchError err, std::string msg) {
    return FetchResult{nullptr, err, std::move(msg)};
  }
};

// Blocking fetch + decode.  Called from the cache's worker thread.
class IImageFetcher {
 public:
  virtual ~IImageFetcher() = default;
  virtual FetchResult Fetch(const std::string& url) = 0;
};

// Shared, bounded image store.
class IImageCache {
 public:
  using FetchCallback = std::function<void(const FetchResult&)>;

  virtual ~IImageCache() = default;

  // Resolves url from the cache or the fetcher.  done runs exactly once, on
  // an unspecified thread (inline on a cache hit).
  virtual void FetchAsync(const std::string& url, FetchCallback done) = 0;

  // Cache lookup only.  nullptr on miss.
  virtual std::shared_ptr<const DecodedImage> Peek(
      const std::string& url) const = 0;
};

}  // namespace reelkit::image

#endif  // REELKIT_IMAGE_IIMAGE_CACHE_HPP_
