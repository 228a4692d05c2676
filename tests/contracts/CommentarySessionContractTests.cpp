// Repository: Gamecast-commentary
// Component: CommentarySession Contract Tests
// Purpose: Idempotent start on the first video track, event dispatch, hard
//          failure reporting and session end.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gamecast/session/CommentarySession.hpp"
#include "fixtures/FakeAudioPacketSource.h"
#include "fixtures/RecordingVoiceSession.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "support/WaitHelpers.hpp"

namespace gamecast::session {
namespace {

using gamecast::testing::DeterministicTimeSource;
using gamecast::testing::DeterministicWaitFactory;
using gamecast::testing::DeterministicWaitStrategy;
using gamecast::testing::EventuallyTrue;
using gamecast::tests::fixtures::FakeSourceScript;
using gamecast::tests::fixtures::FakeSourceState;
using gamecast::tests::fixtures::MakeFakeSourceFactory;
using gamecast::tests::fixtures::RecordingVoiceSession;

commentary::DetectionEvent BallEvent() {
  commentary::DetectionEvent event;
  event.objects.push_back({"sports ball", 0.8});
  return event;
}

class CommentarySessionContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<DeterministicTimeSource>(0);
    voice_ = std::make_shared<RecordingVoiceSession>(clock_);
    state_ = std::make_shared<FakeSourceState>();

    config_.strategy = config::StrategyKind::kEventTriggered;
    config_.feed.source_uri = "fake://match.mp4";
    config_.prompt_seed = 11;
  }

  void TearDown() override {
    if (session_) {
      session_->End();
    }
  }

  void CreateSession(FakeSourceScript script = FakeSourceScript{},
                     size_t max_waits = DeterministicWaitStrategy::kUnlimited) {
    waits_ = std::make_unique<DeterministicWaitFactory>(clock_, max_waits);

    SessionDependencies deps;
    deps.time_source = clock_;
    deps.wait_factory = waits_->AsFactory();
    deps.source_factory = MakeFakeSourceFactory(std::move(script), state_);
    session_ = std::make_unique<CommentarySession>("session-1", config_, voice_, std::move(deps));
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<RecordingVoiceSession> voice_;
  std::shared_ptr<FakeSourceState> state_;
  config::SessionConfig config_;
  std::unique_ptr<DeterministicWaitFactory> waits_;
  std::unique_ptr<CommentarySession> session_;
};

// =============================================================================
// Start on first video track
// =============================================================================

TEST_F(CommentarySessionContractTests, FirstVideoTrackStartsFeederAndScheduler) {
  CreateSession();
  EXPECT_FALSE(session_->Started());

  SessionResult result = session_->SignalTrack(TrackKind::kVideo);
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(session_->Started());

  ASSERT_NE(session_->Feeder(), nullptr);
  ASSERT_NE(session_->Scheduler(), nullptr);
  EXPECT_TRUE(session_->Feeder()->IsRunning());
  EXPECT_TRUE(session_->Scheduler()->IsRunning());
  EXPECT_STREQ(session_->Scheduler()->StrategyName(), "event");
  EXPECT_EQ(state_->open_calls.load(), 1);
  EXPECT_TRUE(voice_->WaitForChunks(1));
}

TEST_F(CommentarySessionContractTests, LaterVideoTracksAreNoOps) {
  CreateSession();
  ASSERT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);
  const auto* feeder = session_->Feeder();
  const auto* scheduler = session_->Scheduler();

  for (int i = 0; i < 3; ++i) {
    SessionResult again = session_->SignalTrack(TrackKind::kVideo);
    EXPECT_TRUE(again.ok);
  }
  EXPECT_EQ(session_->Feeder(), feeder);
  EXPECT_EQ(session_->Scheduler(), scheduler);
  EXPECT_EQ(state_->open_calls.load(), 1);
  EXPECT_EQ(waits_->Created(), 1u);  // Feeder only; event strategy never waits
}

TEST_F(CommentarySessionContractTests, AudioTrackIsIgnored) {
  CreateSession();
  SessionResult result = session_->SignalTrack(TrackKind::kAudio);
  EXPECT_TRUE(result.ok);
  EXPECT_FALSE(session_->Started());
  EXPECT_EQ(session_->Feeder(), nullptr);
  EXPECT_EQ(session_->Scheduler(), nullptr);
  EXPECT_EQ(state_->open_calls.load(), 0);
}

TEST_F(CommentarySessionContractTests, NoSourceConfiguredRunsCommentaryOnly) {
  config_.feed.source_uri.clear();
  CreateSession();
  ASSERT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);
  EXPECT_EQ(session_->Feeder(), nullptr);
  ASSERT_NE(session_->Scheduler(), nullptr);
  EXPECT_TRUE(session_->Scheduler()->IsRunning());
  EXPECT_EQ(state_->open_calls.load(), 0);
}

// =============================================================================
// Hard failure
// =============================================================================

TEST_F(CommentarySessionContractTests, UnavailableSourceIsAHardFailure) {
  FakeSourceScript script;
  script.open_ok = false;
  CreateSession(script);

  SessionResult result = session_->SignalTrack(TrackKind::kVideo);
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.message.find("unavailable"), std::string::npos);
  EXPECT_TRUE(session_->Started());
  EXPECT_FALSE(session_->Feeder()->IsRunning());

  // Commentary is independent of the audio feed.
  ASSERT_NE(session_->Scheduler(), nullptr);
  EXPECT_TRUE(session_->Scheduler()->IsRunning());

  // Not retried on a later video track.
  EXPECT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);
  EXPECT_EQ(state_->open_calls.load(), 1);
}

TEST_F(CommentarySessionContractTests, NoAudioTrackIsNotAFailure) {
  FakeSourceScript script;
  script.has_audio = false;
  CreateSession(script);

  SessionResult result = session_->SignalTrack(TrackKind::kVideo);
  EXPECT_TRUE(result.ok);
  EXPECT_FALSE(session_->Feeder()->IsRunning());
  EXPECT_TRUE(session_->Scheduler()->IsRunning());
  EXPECT_EQ(voice_->ChunkCount(), 0u);
}

// =============================================================================
// Detection dispatch
// =============================================================================

TEST_F(CommentarySessionContractTests, DetectionsBeforeStartAreDropped) {
  CreateSession();
  SessionResult result = session_->ReportDetections(BallEvent());
  EXPECT_TRUE(result.ok);
  EXPECT_FALSE(result.prompt_delivered);
  EXPECT_EQ(voice_->PromptCount(), 0u);
}

TEST_F(CommentarySessionContractTests, DetectionsReachTheEventStrategy) {
  config_.feed.source_uri.clear();
  CreateSession();
  ASSERT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);

  SessionResult opening = session_->HandleEvent(SessionEvent{BallEvent()});
  EXPECT_TRUE(opening.prompt_delivered);

  SessionResult cooling = session_->ReportDetections(BallEvent());
  EXPECT_FALSE(cooling.prompt_delivered);

  clock_->AdvanceMs(config_.event.cooldown_ms);
  SessionResult active = session_->ReportDetections(BallEvent());
  EXPECT_TRUE(active.prompt_delivered);
  EXPECT_EQ(voice_->PromptCount(), 2u);
}

TEST_F(CommentarySessionContractTests, PeriodicStrategyRunsOnItsOwnTimeline) {
  config_.strategy = config::StrategyKind::kPeriodic;
  config_.feed.source_uri.clear();
  CreateSession(FakeSourceScript{}, 4);
  ASSERT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);
  EXPECT_STREQ(session_->Scheduler()->StrategyName(), "periodic");

  ASSERT_TRUE(EventuallyTrue([&] { return !session_->Scheduler()->IsRunning(); }));
  auto prompts = voice_->Prompts();
  ASSERT_EQ(prompts.size(), 4u);
  const auto& t = config_.periodic;
  EXPECT_EQ(prompts[0].at_ms, t.startup_delay_ms);
  EXPECT_EQ(prompts[1].at_ms, t.startup_delay_ms + t.settle_delay_ms);
  EXPECT_EQ(prompts[3].at_ms, t.startup_delay_ms + t.settle_delay_ms + 2 * t.interval_ms);

  // Detections are accepted but never prompt.
  EXPECT_FALSE(session_->ReportDetections(BallEvent()).prompt_delivered);
}

// =============================================================================
// End
// =============================================================================

TEST_F(CommentarySessionContractTests, EndStopsEverythingOnce) {
  CreateSession();
  ASSERT_TRUE(session_->SignalTrack(TrackKind::kVideo).ok);
  ASSERT_TRUE(voice_->WaitForChunks(2));

  session_->End();
  EXPECT_TRUE(session_->Ended());
  EXPECT_FALSE(session_->Feeder()->IsRunning());
  EXPECT_FALSE(session_->Scheduler()->IsRunning());
  EXPECT_EQ(state_->close_calls.load(), 1);

  session_->End();
  session_.reset();
  EXPECT_EQ(state_->close_calls.load(), 1);
}

TEST_F(CommentarySessionContractTests, EndInterruptsAStalledSourceOpen) {
  FakeSourceScript script;
  script.stall_open = true;
  CreateSession(script);

  SessionResult track;
  std::thread signaller([&] { track = session_->SignalTrack(TrackKind::kVideo); });
  ASSERT_TRUE(EventuallyTrue([&] { return state_->open_stalling.load(); }));

  // Other handlers stay responsive while the open is in flight.
  SessionResult detections = session_->ReportDetections(BallEvent());
  EXPECT_TRUE(detections.ok);
  EXPECT_FALSE(detections.prompt_delivered);

  std::atomic<bool> end_returned{false};
  std::thread ender([&] {
    session_->End();
    end_returned.store(true);
  });
  EXPECT_TRUE(EventuallyTrue([&] { return end_returned.load(); }, 2000));

  ender.join();
  signaller.join();
  EXPECT_FALSE(track.ok);
  EXPECT_TRUE(session_->Ended());
  EXPECT_EQ(session_->Scheduler(), nullptr);
  EXPECT_FALSE(session_->Feeder()->IsRunning());
  EXPECT_EQ(voice_->PromptCount(), 0u);
}

TEST_F(CommentarySessionContractTests, EventsAfterEndAreRejected) {
  CreateSession();
  session_->End();

  SessionResult track = session_->SignalTrack(TrackKind::kVideo);
  EXPECT_FALSE(track.ok);
  EXPECT_FALSE(session_->Started());

  SessionResult detections = session_->ReportDetections(BallEvent());
  EXPECT_FALSE(detections.ok);
  EXPECT_EQ(state_->open_calls.load(), 0);
}

}  // namespace
}  // namespace gamecast::session
