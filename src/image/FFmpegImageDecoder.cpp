// Repository: Reelkit-playlist
// Component: FFmpeg Image Decoder
// Copyright (c) 2025 RetroVue

#include "reelkit/image/FFmpegImageDecoder.hpp"

#include "reelkit/decode/FFmpegFrameReader.hpp"
#include "reelkit/util/Logger.hpp"

namespace reelkit::image {

using reelkit::util::Logger;
using reelkit::util::LogLine;

FetchResult FFmpegImageDecoder::Fetch(const std::string& url) {
  decode::FFmpegFrameReader reader;
  std::string error;
  if (!reader.Open(url, &error)) {
    return FetchResult::Failure(FetchError::kNotFound, error);
  }

  decode::FramePtr frame;
  double pts_s = 0.0;
  const auto status = reader.ReadFrame(&frame, &pts_s, &error);
  if (status != decode::FFmpegFrameReader::ReadStatus::kFrame) {
    return FetchResult::Failure(
        FetchError::kDecodeFailed,
        error.empty() ? "no picture in input" : error);
  }

  auto image = reader.ToRgba(frame.get(), &error);
  if (!image) {
    return FetchResult::Failure(FetchError::kDecodeFailed, error);
  }

  Logger::Debug(LogLine("FFmpegImageDecoder", "DECODED")
                    .Kv("url", url)
                    .Kv("width", image->width)
                    .Kv("height", image->height)
                    .Str());
  return FetchResult::Success(std::move(image));
}

}  // namespace reelkit::image
