// Repository: Reelkit-playlist
// Component: PlaybackNotifier Contract Tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "reelkit/notify/PlaybackNotifier.hpp"

#include "support/DeterministicTimeSource.hpp"

namespace reelkit::notify::testing {
namespace {

TEST(PlaybackNotifierContract, RequiresClock) {
  EXPECT_THROW(PlaybackNotifier("ctl", nullptr), std::invalid_argument);
}

TEST(PlaybackNotifierContract, StampsSequenceTimeAndController) {
  DeterministicTimeSource clock(1700000000000);
  PlaybackNotifier notifier("ctl-7", &clock);
  std::vector<PlaybackEvent> events;
  auto sub = notifier.Subscribe(
      [&](const PlaybackEvent& e) { events.push_back(e); });

  notifier.EmitVideoRequested("file:///v.mp4");
  clock.AdvanceMs(250);
  notifier.EmitVideoStarted("file:///v.mp4");
  notifier.EmitVideoStalled("file:///v.mp4");
  notifier.EmitVideoError("file:///v.mp4", "decode failed");

  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].kind, PlaybackEventKind::kVideoRequested);
  EXPECT_EQ(events[0].timestamp_utc_ms, 1700000000000);
  EXPECT_EQ(events[1].timestamp_utc_ms, 1700000000250);
  EXPECT_EQ(events[3].kind, PlaybackEventKind::kVideoError);
  ASSERT_TRUE(events[3].error.has_value());
  EXPECT_EQ(*events[3].error, "decode failed");
  EXPECT_FALSE(events[1].error.has_value());

  for (size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].sequence, i + 1);
    EXPECT_EQ(events[i].controller_id, "ctl-7");
    EXPECT_EQ(events[i].url, "file:///v.mp4");
  }
  EXPECT_EQ(notifier.CurrentSequence(), 4u);
}

TEST(PlaybackNotifierContract, EmitsWithoutSubscribers) {
  DeterministicTimeSource clock;
  PlaybackNotifier notifier("ctl", &clock);
  notifier.EmitVideoStarted("u");
  EXPECT_EQ(notifier.CurrentSequence(), 1u);
}

TEST(PlaybackNotifierContract, KindNames) {
  EXPECT_STREQ(PlaybackEventKindName(PlaybackEventKind::kVideoRequested),
               "video_requested");
  EXPECT_STREQ(PlaybackEventKindName(PlaybackEventKind::kVideoError),
               "video_error");
}

}  // namespace
}  // namespace reelkit::notify::testing
