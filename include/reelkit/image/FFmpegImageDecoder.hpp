// Repository: Reelkit-playlist
// Component: FFmpeg Image Decoder
// Purpose: IImageFetcher that opens a still image (file path or any URL
//          libavformat understands) and decodes it to RGBA.
// Copyright (c) 2025 RetroVue

#ifndef REELKIT_IMAGE_FFMPEG_IMAGE_DECODER_HPP_
#define REELKIT_IMAGE_FFMPEG_IMAGE_DECODER_HPP_

#include <string>

#include "reelkit/image/IImageCache.hpp"

namespace reelkit::image {

// Stateless; each Fetch() opens its own decoder.  Safe to call from the
// image cache worker.
class FFmpegImageDecoder : public IImageFetcher {
 public:
  FetchResult Fetch(const std::string& url) override;
};

}  // namespace reelkit::image

#endif  // REELKIT_IMAGE_FFMPEG_IMAGE_DECODER_HPP_
