// Repository: Reelkit-playlist
// Component: RendererSlot Contract Tests
// Purpose: Per-variant prepare policy, load-failure fallback, and discard of
//          completions that arrive after the slot was rebound.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include "reelkit/notify/PlaybackNotifier.hpp"
#include "reelkit/telemetry/PlaylistMetrics.hpp"
#include "reelkit/window/RendererSlot.hpp"

#include "fixtures/FakeMediaRenderer.h"
#include "fixtures/StubImageCache.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/ManualExecutor.hpp"

namespace reelkit::window::testing {
namespace {

using playlist::Behavior;
using playlist::PlaylistItem;
using reelkit::tests::fixtures::FakeMediaRenderer;
using reelkit::tests::fixtures::StubImageCache;
using std::chrono::milliseconds;

class RendererSlotContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    context_.executor = &executor_;
    context_.image_cache = &images_;
    context_.notifier = &notifier_;
    context_.metrics = &metrics_;
    context_.config.timer_tick_ms = 100;
    context_.config.error_fallback_duration_s = 5.0;
    context_.config.default_image_duration_s = 10.0;

    auto renderer = std::make_unique<FakeMediaRenderer>(0);
    renderer_ = renderer.get();
    slot_ = RendererSlot::Create(7, std::move(renderer), &context_);
    slot_->SetOnEnded([this](RendererSlot&) { ended_++; });
    slot_->SetOnChanged([this](RendererSlot&) { changes_++; });

    subscription_ = notifier_.Subscribe(
        [this](const notify::PlaybackEvent& e) { events_.push_back(e); });
  }

  void TearDown() override {
    subscription_.Reset();
    slot_.reset();
  }

  ManualExecutor executor_;
  StubImageCache images_;
  DeterministicTimeSource clock_{1'700'000'000'000};
  notify::PlaybackNotifier notifier_{"slot-test", &clock_};
  telemetry::PlaylistMetrics metrics_;
  SlotContext context_;

  FakeMediaRenderer* renderer_ = nullptr;
  std::shared_ptr<RendererSlot> slot_;
  runtime::Subscription subscription_;
  std::vector<notify::PlaybackEvent> events_;
  int ended_ = 0;
  int changes_ = 0;
};

// =============================================================================
// Construction
// =============================================================================

TEST(RendererSlotCreateContract, RequiresExecutorAndRenderer) {
  SlotContext no_executor;
  EXPECT_THROW(RendererSlot::Create(
                   0, std::make_unique<FakeMediaRenderer>(0), &no_executor),
               std::invalid_argument);

  ManualExecutor executor;
  SlotContext context;
  context.executor = &executor;
  EXPECT_THROW(RendererSlot::Create(0, nullptr, &context),
               std::invalid_argument);
}

TEST_F(RendererSlotContractTest, StartsIdle) {
  EXPECT_EQ(slot_->Status(), SlotStatus::kIdle);
  EXPECT_FALSE(slot_->BoundItem().has_value());
  EXPECT_EQ(ProjectStatus(slot_->Status()), playlist::ItemStatus::kLoading);
}

// =============================================================================
// Custom / Error
// =============================================================================

TEST_F(RendererSlotContractTest, CustomIsReadyImmediatelyAndRunsOnTimer) {
  auto item = PlaylistItem::Custom(1.0);
  EXPECT_TRUE(slot_->Prepare(item));
  EXPECT_EQ(slot_->Status(), SlotStatus::kReady);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 1.0);

  slot_->Play();
  executor_.AdvanceBy(milliseconds(500));
  EXPECT_NEAR(slot_->ProgressSeconds(), 0.5, 1e-9);
  EXPECT_EQ(ended_, 0);

  executor_.AdvanceBy(milliseconds(500));
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 1.0);
  EXPECT_EQ(ended_, 1);

  executor_.AdvanceBy(milliseconds(1000));
  EXPECT_EQ(ended_, 1) << "timer stops at the end";
}

TEST_F(RendererSlotContractTest, TimerHonorsRate) {
  slot_->Prepare(PlaylistItem::Custom(10.0));
  slot_->SetRate(2.0f);
  slot_->Play();
  executor_.AdvanceBy(milliseconds(1000));
  EXPECT_NEAR(slot_->ProgressSeconds(), 2.0, 1e-9);
}

TEST_F(RendererSlotContractTest, ErrorItemUsesFallbackDuration) {
  slot_->Prepare(PlaylistItem::Error());
  EXPECT_EQ(slot_->Status(), SlotStatus::kError);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 5.0);

  slot_->Play();
  executor_.AdvanceBy(milliseconds(4900));
  EXPECT_EQ(ended_, 0);
  executor_.AdvanceBy(milliseconds(100));
  EXPECT_EQ(ended_, 1);
}

TEST_F(RendererSlotContractTest, PauseStopsTimer) {
  slot_->Prepare(PlaylistItem::Custom(5.0));
  slot_->Play();
  executor_.AdvanceBy(milliseconds(300));
  slot_->Pause();
  const double at_pause = slot_->ProgressSeconds();
  executor_.AdvanceBy(milliseconds(2000));
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), at_pause);
  EXPECT_FALSE(slot_->IsPlaying());
}

TEST_F(RendererSlotContractTest, PrepareSameItemIsNoOp) {
  auto item = PlaylistItem::Custom(3.0);
  EXPECT_TRUE(slot_->Prepare(item));
  const uint64_t gen = slot_->Generation();
  EXPECT_FALSE(slot_->Prepare(item));
  EXPECT_EQ(slot_->Generation(), gen);
  EXPECT_EQ(metrics_.slot_binds_total, 1);
}

// =============================================================================
// Seek / rewind / replay
// =============================================================================

TEST_F(RendererSlotContractTest, SeekOnCustomEchoesSynchronouslyClamped) {
  slot_->Prepare(PlaylistItem::Custom(4.0));
  slot_->Seek(2.5);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 2.5);
  slot_->Seek(99.0);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 4.0);
  slot_->Seek(-1.0);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 0.0);
}

TEST_F(RendererSlotContractTest, SeekOnVideoGoesThroughRenderer) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  renderer_->FireReady(20.0);
  executor_.RunUntilIdle();

  slot_->Seek(7.0);
  ASSERT_FALSE(renderer_->seeks().empty());
  EXPECT_DOUBLE_EQ(renderer_->seeks().back(), 7.0);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 0.0) << "no echo before report";

  renderer_->FireProgress(6.96);
  executor_.RunUntilIdle();
  EXPECT_NEAR(slot_->ProgressSeconds(), 7.0, 0.1);
}

TEST_F(RendererSlotContractTest, RewindPausesAndResetsProgress) {
  slot_->Prepare(PlaylistItem::Custom(4.0));
  slot_->Play();
  executor_.AdvanceBy(milliseconds(1500));
  ASSERT_GT(slot_->ProgressSeconds(), 0.0);

  slot_->Rewind();
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 0.0);
  EXPECT_FALSE(slot_->IsPlaying());
  EXPECT_EQ(slot_->ReplayCount(), 0);
}

TEST_F(RendererSlotContractTest, ReplayRestartsAndCounts) {
  slot_->Prepare(PlaylistItem::Custom(1.0, Behavior::Repeat(3)));
  slot_->Play();
  executor_.AdvanceBy(milliseconds(1000));
  ASSERT_EQ(ended_, 1);

  slot_->Replay();
  EXPECT_EQ(slot_->ReplayCount(), 1);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 0.0);
  EXPECT_EQ(metrics_.loop_replays_total, 1);

  executor_.AdvanceBy(milliseconds(1000));
  EXPECT_EQ(ended_, 2) << "replay keeps play intent";
}

TEST_F(RendererSlotContractTest, PlayAfterEndRestartsFromZero) {
  slot_->Prepare(PlaylistItem::Custom(1.0));
  slot_->Play();
  executor_.AdvanceBy(milliseconds(1000));
  ASSERT_EQ(ended_, 1);
  ASSERT_TRUE(slot_->IsPlaying());

  slot_->Play();
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 0.0);
  executor_.AdvanceBy(milliseconds(300));
  EXPECT_NEAR(slot_->ProgressSeconds(), 0.3, 1e-9);

  executor_.AdvanceBy(milliseconds(700));
  EXPECT_EQ(ended_, 2);
}

TEST_F(RendererSlotContractTest, SeekAfterEndRestartsTimer) {
  slot_->Prepare(PlaylistItem::Custom(1.0));
  slot_->Play();
  executor_.AdvanceBy(milliseconds(1000));
  ASSERT_EQ(ended_, 1);

  slot_->Seek(0.5);
  executor_.AdvanceBy(milliseconds(200));
  EXPECT_NEAR(slot_->ProgressSeconds(), 0.7, 1e-9);
}

// =============================================================================
// Image
// =============================================================================

TEST_F(RendererSlotContractTest, ImageLoadsThroughCache) {
  slot_->Prepare(PlaylistItem::Image("file:///a.png", 3.0));
  EXPECT_EQ(slot_->Status(), SlotStatus::kLoading);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 3.0);
  ASSERT_EQ(images_.pendingCount(), 1u);

  ASSERT_TRUE(images_.CompleteSuccess("file:///a.png"));
  EXPECT_EQ(slot_->Status(), SlotStatus::kLoading)
      << "completion is marshaled through the executor";
  executor_.RunUntilIdle();
  EXPECT_EQ(slot_->Status(), SlotStatus::kReady);
  EXPECT_NE(slot_->Image(), nullptr);
}

TEST_F(RendererSlotContractTest, ImageWithoutDurationUsesDefault) {
  slot_->Prepare(PlaylistItem::Image("file:///a.png", 0.0));
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 10.0);
}

TEST_F(RendererSlotContractTest, ImageFailureFallsBackToErrorTimer) {
  images_.SetAutoFailure("file:///missing.png");
  slot_->Prepare(PlaylistItem::Image("file:///missing.png", 3.0));
  slot_->Play();
  executor_.RunUntilIdle();

  EXPECT_EQ(slot_->Status(), SlotStatus::kError);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 5.0);
  EXPECT_EQ(metrics_.load_failures_total, 1);

  executor_.AdvanceBy(milliseconds(5000));
  EXPECT_EQ(ended_, 1) << "a bad item never stalls the playlist";
}

TEST_F(RendererSlotContractTest, StaleImageResultIsDiscarded) {
  slot_->Prepare(PlaylistItem::Image("file:///a.png", 3.0));
  auto replacement = PlaylistItem::Custom(2.0);
  slot_->Prepare(replacement);

  ASSERT_TRUE(images_.CompleteSuccess("file:///a.png"));
  executor_.RunUntilIdle();

  EXPECT_TRUE(slot_->IsBoundTo(replacement));
  EXPECT_EQ(slot_->Image(), nullptr);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 2.0);
  EXPECT_EQ(metrics_.stale_results_discarded_total, 1);
}

TEST_F(RendererSlotContractTest, StaleImageResultAfterClearIsDiscarded) {
  slot_->Prepare(PlaylistItem::Image("file:///a.png", 3.0));
  slot_->Clear();
  images_.CompleteSuccess("file:///a.png");
  executor_.RunUntilIdle();
  EXPECT_EQ(slot_->Status(), SlotStatus::kIdle);
  EXPECT_EQ(metrics_.stale_results_discarded_total, 1);
}

// =============================================================================
// Video
// =============================================================================

TEST_F(RendererSlotContractTest, VideoOpensRendererAndEmitsRequested) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  EXPECT_EQ(slot_->Status(), SlotStatus::kLoading);
  EXPECT_TRUE(renderer_->isOpen());
  EXPECT_EQ(renderer_->url(), "file:///v.mp4");

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].kind, notify::PlaybackEventKind::kVideoRequested);
  EXPECT_EQ(events_[0].url, "file:///v.mp4");
  EXPECT_EQ(events_[0].timestamp_utc_ms, 1'700'000'000'000);
  EXPECT_FALSE(events_[0].error.has_value());
}

TEST_F(RendererSlotContractTest, VideoReadyNormalizesUnknownDuration) {
  slot_->Prepare(PlaylistItem::Video("file:///live.ts"));
  renderer_->FireReady(std::numeric_limits<double>::quiet_NaN());
  executor_.RunUntilIdle();
  EXPECT_EQ(slot_->Status(), SlotStatus::kReady);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 0.0);

  slot_->Prepare(PlaylistItem::Video("file:///forever.ts"));
  renderer_->FireReady(std::numeric_limits<double>::infinity());
  executor_.RunUntilIdle();
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 0.0);
}

TEST_F(RendererSlotContractTest, VideoPlaysOnlyOnceReady) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  slot_->Play();
  EXPECT_FALSE(renderer_->isPlaying());

  renderer_->FireReady(12.0);
  executor_.RunUntilIdle();
  EXPECT_TRUE(renderer_->isPlaying());
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 12.0);
}

TEST_F(RendererSlotContractTest, VideoStartedAndStalledReachNotifier) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  renderer_->FireReady(12.0);
  renderer_->FireStarted();
  renderer_->FireStalled();
  executor_.RunUntilIdle();

  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[1].kind, notify::PlaybackEventKind::kVideoStarted);
  EXPECT_EQ(events_[2].kind, notify::PlaybackEventKind::kVideoStalled);
  EXPECT_LT(events_[0].sequence, events_[1].sequence);
  EXPECT_LT(events_[1].sequence, events_[2].sequence);
}

TEST_F(RendererSlotContractTest, VideoEndSignalsOnlyWhilePlaying) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  renderer_->FireReady(12.0);
  executor_.RunUntilIdle();
  renderer_->FireEnded();
  executor_.RunUntilIdle();
  EXPECT_EQ(ended_, 0);

  slot_->Play();
  renderer_->FireEnded();
  executor_.RunUntilIdle();
  EXPECT_EQ(ended_, 1);
  EXPECT_DOUBLE_EQ(slot_->ProgressSeconds(), 12.0);
}

TEST_F(RendererSlotContractTest, VideoSeekAfterEndReissuesPlay) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  renderer_->FireReady(12.0);
  executor_.RunUntilIdle();
  slot_->Play();
  const int plays = renderer_->playCount();

  renderer_->FireEnded();
  executor_.RunUntilIdle();
  ASSERT_EQ(ended_, 1);

  slot_->Seek(0.0);
  EXPECT_DOUBLE_EQ(renderer_->seeks().back(), 0.0);
  EXPECT_EQ(renderer_->playCount(), plays + 1);

  slot_->Seek(4.0);
  EXPECT_EQ(renderer_->playCount(), plays + 1) << "only the first seek resumes";
}

TEST_F(RendererSlotContractTest, VideoErrorCancelsRendererAndFallsBack) {
  slot_->Prepare(PlaylistItem::Video("file:///broken.mp4"));
  slot_->Play();
  renderer_->FireError("moov atom not found");
  executor_.RunUntilIdle();

  EXPECT_EQ(slot_->Status(), SlotStatus::kError);
  EXPECT_FALSE(renderer_->isOpen());
  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1].kind, notify::PlaybackEventKind::kVideoError);
  ASSERT_TRUE(events_[1].error.has_value());
  EXPECT_EQ(*events_[1].error, "moov atom not found");

  executor_.AdvanceBy(milliseconds(5000));
  EXPECT_EQ(ended_, 1);
}

TEST_F(RendererSlotContractTest, StaleVideoReadyIsDiscarded) {
  slot_->Prepare(PlaylistItem::Video("file:///first.mp4"));
  slot_->Prepare(PlaylistItem::Video("file:///second.mp4"));
  EXPECT_EQ(renderer_->cancelCount(), 1);

  // The first open's ready callback races the rebind.
  renderer_->FireStaleReady(30.0);
  executor_.RunUntilIdle();

  EXPECT_EQ(slot_->Status(), SlotStatus::kLoading);
  EXPECT_EQ(metrics_.stale_results_discarded_total, 1);

  renderer_->FireReady(8.0);
  executor_.RunUntilIdle();
  EXPECT_EQ(slot_->Status(), SlotStatus::kReady);
  EXPECT_DOUBLE_EQ(slot_->DurationSeconds(), 8.0);
}

TEST_F(RendererSlotContractTest, ClearCancelsAndReturnsToIdle) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  slot_->Clear();
  EXPECT_EQ(slot_->Status(), SlotStatus::kIdle);
  EXPECT_FALSE(renderer_->isOpen());
  EXPECT_FALSE(slot_->BoundItem().has_value());
  EXPECT_EQ(metrics_.slot_clears_total, 1);

  slot_->Clear();
  EXPECT_EQ(metrics_.slot_clears_total, 1) << "clearing idle is a no-op";
}

TEST_F(RendererSlotContractTest, RateIsForwardedToRenderer) {
  slot_->Prepare(PlaylistItem::Video("file:///v.mp4"));
  slot_->SetRate(1.5f);
  EXPECT_FLOAT_EQ(renderer_->rate(), 1.5f);
}

}  // namespace
}  // namespace reelkit::window::testing
