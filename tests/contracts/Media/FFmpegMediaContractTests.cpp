// Repository: Reelkit-playlist
// Component: FFmpeg Media Contract Tests
// Purpose: Frame reader, image decoder and renderer against real inputs.
//          Tests that need media read its location from
//          REELKIT_TEST_VIDEO_PATH / REELKIT_TEST_IMAGE_PATH and skip when
//          unset.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "reelkit/decode/FFmpegFrameReader.hpp"
#include "reelkit/image/FFmpegImageDecoder.hpp"
#include "reelkit/render/FFmpegMediaRenderer.hpp"

namespace reelkit::render::testing {
namespace {

constexpr auto kWait = std::chrono::seconds(10);
constexpr const char* kMissingPath = "/nonexistent/reelkit/missing.mp4";

std::string EnvPath(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

// =============================================================================
// FFmpegFrameReader
// =============================================================================

TEST(FFmpegFrameReaderContract, OpenMissingInputFails) {
  decode::FFmpegFrameReader reader;
  std::string error;
  EXPECT_FALSE(reader.Open(kMissingPath, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(reader.IsOpen());
}

TEST(FFmpegFrameReaderContract, DecodesFramesInPresentationOrder) {
  const std::string path = EnvPath("REELKIT_TEST_VIDEO_PATH");
  if (path.empty()) GTEST_SKIP() << "REELKIT_TEST_VIDEO_PATH not set";

  decode::FFmpegFrameReader reader;
  std::string error;
  ASSERT_TRUE(reader.Open(path, &error)) << error;
  EXPECT_GT(reader.Width(), 0);
  EXPECT_GT(reader.Height(), 0);

  double last_pts = -1.0;
  for (int i = 0; i < 10; ++i) {
    decode::FramePtr frame;
    double pts_s = 0.0;
    const auto status = reader.ReadFrame(&frame, &pts_s, &error);
    if (status == decode::FFmpegFrameReader::ReadStatus::kEndOfStream) break;
    ASSERT_EQ(status, decode::FFmpegFrameReader::ReadStatus::kFrame) << error;
    EXPECT_GE(pts_s, last_pts);
    last_pts = pts_s;

    auto rgba = reader.ToRgba(frame.get(), &error);
    ASSERT_NE(rgba, nullptr) << error;
    EXPECT_EQ(rgba->rgba.size(),
              static_cast<size_t>(rgba->width) * rgba->height * 4);
  }
}

// =============================================================================
// FFmpegImageDecoder
// =============================================================================

TEST(FFmpegImageDecoderContract, MissingImageIsNotFound) {
  image::FFmpegImageDecoder decoder;
  const auto result = decoder.Fetch("/nonexistent/reelkit/missing.png");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, image::FetchError::kNotFound);
}

TEST(FFmpegImageDecoderContract, DecodesStillImageToRgba) {
  const std::string path = EnvPath("REELKIT_TEST_IMAGE_PATH");
  if (path.empty()) GTEST_SKIP() << "REELKIT_TEST_IMAGE_PATH not set";

  image::FFmpegImageDecoder decoder;
  const auto result = decoder.Fetch(path);
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_GT(result.image->width, 0);
  EXPECT_GT(result.image->height, 0);
  EXPECT_EQ(result.image->rgba.size(),
            static_cast<size_t>(result.image->width) * result.image->height *
                4);
}

// =============================================================================
// FFmpegMediaRenderer
// =============================================================================

TEST(FFmpegMediaRendererContract, OpenMissingInputReportsError) {
  FFmpegMediaRenderer renderer(FFmpegRendererConfig{});
  std::promise<std::string> error;
  RendererCallbacks callbacks;
  callbacks.on_error = [&](const std::string& e) { error.set_value(e); };
  callbacks.on_ready = [](double) { ADD_FAILURE() << "ready on missing input"; };

  renderer.Open(kMissingPath, callbacks);
  auto future = error.get_future();
  ASSERT_EQ(future.wait_for(kWait), std::future_status::ready);
  EXPECT_FALSE(future.get().empty());
  renderer.Cancel();
}

TEST(FFmpegMediaRendererContract, ReadyThenStartedThenCancel) {
  const std::string path = EnvPath("REELKIT_TEST_VIDEO_PATH");
  if (path.empty()) GTEST_SKIP() << "REELKIT_TEST_VIDEO_PATH not set";

  FFmpegMediaRenderer renderer(FFmpegRendererConfig{});
  std::promise<double> ready;
  std::promise<void> started;
  std::atomic<bool> started_once{false};
  std::atomic<int> after_cancel{0};
  std::atomic<bool> cancelled{false};

  RendererCallbacks callbacks;
  callbacks.on_ready = [&](double duration_s) { ready.set_value(duration_s); };
  callbacks.on_started = [&] {
    if (!started_once.exchange(true)) started.set_value();
  };
  callbacks.on_progress = [&](double) {
    if (cancelled.load()) after_cancel++;
  };
  callbacks.on_error = [](const std::string& e) { ADD_FAILURE() << e; };

  renderer.Open(path, callbacks);
  auto ready_future = ready.get_future();
  ASSERT_EQ(ready_future.wait_for(kWait), std::future_status::ready);
  const double duration = ready_future.get();
  EXPECT_TRUE(std::isnan(duration) || duration > 0.0);
  EXPECT_NE(renderer.LatestFrame(), nullptr);

  renderer.Play();
  auto started_future = started.get_future();
  ASSERT_EQ(started_future.wait_for(kWait), std::future_status::ready);

  renderer.Cancel();
  cancelled = true;
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(after_cancel.load(), 0);
}

TEST(FFmpegMediaRendererContract, CanReopenAfterCancel) {
  const std::string path = EnvPath("REELKIT_TEST_VIDEO_PATH");
  if (path.empty()) GTEST_SKIP() << "REELKIT_TEST_VIDEO_PATH not set";

  FFmpegRendererFactory factory(FFmpegRendererConfig{});
  auto renderer = factory.CreateRenderer();
  for (int round = 0; round < 2; ++round) {
    std::promise<void> ready;
    RendererCallbacks callbacks;
    callbacks.on_ready = [&](double) { ready.set_value(); };
    renderer->Open(path, callbacks);
    ASSERT_EQ(ready.get_future().wait_for(kWait), std::future_status::ready)
        << "round " << round;
    renderer->Cancel();
  }
}

}  // namespace
}  // namespace reelkit::render::testing
