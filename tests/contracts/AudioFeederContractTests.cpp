// Repository: Gamecast-commentary
// Component: AudioFeeder Contract Tests
// Purpose: Loop ordering, no-audio sources, fault backoff, stop/release and
//          unreachable-sink behavior of the feeder, on virtual time.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "gamecast/audio/AudioFeeder.hpp"
#include "gamecast/util/Logger.hpp"
#include "fixtures/FakeAudioPacketSource.h"
#include "fixtures/RecordingVoiceSession.h"
#include "support/DeterministicTimeSource.hpp"
#include "support/DeterministicWaitStrategy.hpp"
#include "support/WaitHelpers.hpp"

namespace gamecast::audio {
namespace {

using gamecast::testing::DeterministicTimeSource;
using gamecast::testing::DeterministicWaitStrategy;
using gamecast::testing::EventuallyTrue;
using gamecast::tests::fixtures::FakeAudioPacketSource;
using gamecast::tests::fixtures::FakeSourceScript;
using gamecast::tests::fixtures::FakeSourceState;
using gamecast::tests::fixtures::MakeFakeSourceFactory;
using gamecast::tests::fixtures::RecordingVoiceSession;
using gamecast::util::Logger;

// =============================================================================
// Test Fixture
// =============================================================================

class AudioFeederContractTests : public ::testing::Test {
 protected:
  static constexpr int64_t kFaultBackoffMs = 1000;

  void SetUp() override {
    clock_ = std::make_shared<DeterministicTimeSource>(0);
    state_ = std::make_shared<FakeSourceState>();
    session_ = std::make_shared<RecordingVoiceSession>(clock_);

    errors_ = std::make_shared<std::vector<std::string>>();
    warnings_ = std::make_shared<std::vector<std::string>>();
    auto errors = errors_;
    auto warnings = warnings_;
    Logger::SetErrorSink([errors](const std::string& line) { errors->push_back(line); });
    Logger::SetWarnSink([warnings](const std::string& line) { warnings->push_back(line); });
  }

  void TearDown() override {
    if (feeder_) {
      feeder_->Stop();
    }
    Logger::SetErrorSink(nullptr);
    Logger::SetWarnSink(nullptr);
  }

  void CreateFeeder(FakeSourceScript script,
                    size_t max_waits = DeterministicWaitStrategy::kUnlimited) {
    AudioFeederConfig config;
    config.source_uri = "fake://match.mp4";
    config.fault_backoff_ms = kFaultBackoffMs;
    config.packet_yield_ms = 1;
    config.pace_realtime = true;

    auto wait = std::make_unique<DeterministicWaitStrategy>(clock_, max_waits);
    wait_ = wait.get();
    feeder_ = std::make_unique<AudioFeeder>(
        config, MakeFakeSourceFactory(std::move(script), state_), std::move(wait), clock_);
  }

  std::vector<std::string> Labels(size_t count) const {
    std::vector<std::string> labels;
    for (const auto& record : session_->Chunks()) {
      if (labels.size() == count) break;
      labels.push_back(FakeAudioPacketSource::Label(record.chunk));
    }
    return labels;
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<FakeSourceState> state_;
  std::shared_ptr<RecordingVoiceSession> session_;
  DeterministicWaitStrategy* wait_ = nullptr;  // Owned by feeder_
  std::unique_ptr<AudioFeeder> feeder_;

  // Logger sinks may fire from the feed thread; only read after Stop().
  std::shared_ptr<std::vector<std::string>> errors_;
  std::shared_ptr<std::vector<std::string>> warnings_;
};

// =============================================================================
// Loop and ordering
// =============================================================================

TEST_F(AudioFeederContractTests, EmitsInPlaybackOrderAndLoops) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);

  ASSERT_TRUE(session_->WaitForChunks(9));
  feeder_->Stop();

  std::vector<std::string> expected = {"A", "B", "C", "A", "B", "C", "A", "B", "C"};
  EXPECT_EQ(Labels(9), expected);
  EXPECT_GE(feeder_->Stats().loops, 2u);
  EXPECT_GE(state_->seek_calls.load(), 2);
  EXPECT_FALSE(feeder_->IsRunning());
}

TEST_F(AudioFeederContractTests, ChunksCarryCanonicalFormatTag) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  ASSERT_TRUE(session_->WaitForChunks(1));
  feeder_->Stop();

  for (const auto& record : session_->Chunks()) {
    EXPECT_EQ(record.mime_type, "audio/pcm;rate=16000");
  }
}

TEST_F(AudioFeederContractTests, EmissionIsPacedAtPlaybackCadence) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  ASSERT_TRUE(session_->WaitForChunks(3));
  feeder_->Stop();

  auto chunks = session_->Chunks();
  ASSERT_GE(chunks.size(), 3u);
  // 100 ms chunks, anchored at the start of the pass.
  EXPECT_EQ(chunks[0].at_ms, 0);
  EXPECT_EQ(chunks[1].at_ms, 100);
  EXPECT_EQ(chunks[2].at_ms, 200);
}

TEST_F(AudioFeederContractTests, StartIsSingleAssignment) {
  CreateFeeder(FakeSourceScript{});
  EXPECT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  EXPECT_EQ(feeder_->Start(session_), FeederStartResult::kAlreadyStarted);
  feeder_->Stop();
  EXPECT_EQ(state_->open_calls.load(), 1);
  EXPECT_TRUE(state_->interrupt_flag_installed.load());
}

// =============================================================================
// No audio track / unavailable source
// =============================================================================

TEST_F(AudioFeederContractTests, NoAudioTrackEmitsNothingAndReturnsPromptly) {
  FakeSourceScript script;
  script.has_audio = false;
  CreateFeeder(script);

  EXPECT_EQ(feeder_->Start(session_), FeederStartResult::kNoAudioTrack);
  EXPECT_FALSE(feeder_->IsRunning());
  EXPECT_EQ(state_->decode_calls.load(), 0);
  EXPECT_EQ(state_->close_calls.load(), 1);

  feeder_->Stop();
  EXPECT_EQ(session_->ChunkCount(), 0u);
  EXPECT_EQ(state_->close_calls.load(), 1);
  ASSERT_EQ(warnings_->size(), 1u);
  EXPECT_NE(warnings_->front().find("No audio track"), std::string::npos);
  EXPECT_TRUE(errors_->empty());
}

TEST_F(AudioFeederContractTests, SourceOpenFailureIsReported) {
  FakeSourceScript script;
  script.open_ok = false;
  CreateFeeder(script);

  EXPECT_EQ(feeder_->Start(session_), FeederStartResult::kSourceUnavailable);
  EXPECT_FALSE(feeder_->IsRunning());
  EXPECT_EQ(state_->decode_calls.load(), 0);
  feeder_->Stop();
  EXPECT_EQ(session_->ChunkCount(), 0u);
  EXPECT_FALSE(errors_->empty());
}

TEST_F(AudioFeederContractTests, StopBeforeStartPreventsFeeding) {
  CreateFeeder(FakeSourceScript{});
  feeder_->Stop();
  EXPECT_EQ(feeder_->Start(session_), FeederStartResult::kStopped);
  EXPECT_EQ(state_->open_calls.load(), 0);
}

// =============================================================================
// Fault recovery
// =============================================================================

TEST_F(AudioFeederContractTests, MidStreamFaultBacksOffOnceAndResumes) {
  FakeSourceScript script;
  script.fault_on_decode_call = 1;  // Right after "A"
  CreateFeeder(script);
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);

  ASSERT_TRUE(session_->WaitForChunks(6));
  feeder_->Stop();

  EXPECT_EQ(wait_->CountWaitFor(kFaultBackoffMs), 1u);
  EXPECT_EQ(feeder_->Stats().faults, 1u);

  // Decoding continued from the current position after the backoff.
  std::vector<std::string> expected = {"A", "B", "C", "A", "B", "C"};
  EXPECT_EQ(Labels(6), expected);

  auto chunks = session_->Chunks();
  EXPECT_EQ(chunks[0].at_ms, 0);
  EXPECT_GE(chunks[1].at_ms, 1 + kFaultBackoffMs);

  ASSERT_EQ(errors_->size(), 1u);
  EXPECT_NE(errors_->front().find("retrying in 1000ms"), std::string::npos);
}

TEST_F(AudioFeederContractTests, FailedRewindIsTreatedAsFault) {
  FakeSourceScript script;
  script.seek_ok = false;
  CreateFeeder(script);
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);

  ASSERT_TRUE(EventuallyTrue([&] { return feeder_->Stats().faults >= 2; }));
  feeder_->Stop();

  std::vector<std::string> expected = {"A", "B", "C"};
  EXPECT_EQ(Labels(3), expected);
  EXPECT_EQ(feeder_->Stats().loops, 0u);
  EXPECT_TRUE(feeder_->Stats().faults >= 2);
}

TEST_F(AudioFeederContractTests, EmptyPassesBackOffInsteadOfSpinning) {
  FakeSourceScript script;
  script.packets = {};
  CreateFeeder(script, 3);
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);

  // Three granted backoffs, then the fourth wait winds the feeder down.
  ASSERT_TRUE(EventuallyTrue([&] { return !feeder_->IsRunning(); }));
  feeder_->Stop();

  EXPECT_EQ(state_->decode_calls.load(), 4);
  EXPECT_EQ(state_->seek_calls.load(), 4);
  EXPECT_EQ(wait_->CountWaitFor(kFaultBackoffMs), 3u);
  EXPECT_EQ(clock_->NowMs(), 3 * kFaultBackoffMs);
  EXPECT_EQ(session_->ChunkCount(), 0u);
  EXPECT_EQ(feeder_->Stats().faults, 0u);

  ASSERT_EQ(warnings_->size(), 1u);
  EXPECT_NE(warnings_->front().find("No audio decoded"), std::string::npos);
}

TEST_F(AudioFeederContractTests, LoopRestartYieldsBeforeNextPass) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  ASSERT_TRUE(session_->WaitForChunks(4));
  feeder_->Stop();

  // Pacing and packet yields for A, B, C, then one yield for the restart
  // before the second pass paces its first chunk.
  using Kind = gamecast::testing::WaitRecord::Kind;
  const std::vector<Kind> expected = {Kind::kUntil, Kind::kFor, Kind::kUntil, Kind::kFor,
                                      Kind::kUntil, Kind::kFor, Kind::kFor, Kind::kUntil};
  auto records = wait_->Records();
  ASSERT_GE(records.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(records[i].kind, expected[i]) << "wait " << i;
  }
  EXPECT_EQ(records[6].requested_ms, 1);
  EXPECT_EQ(wait_->CountWaitFor(kFaultBackoffMs), 0u);
}

// =============================================================================
// Stop and release
// =============================================================================

TEST_F(AudioFeederContractTests, StopReleasesSourceExactlyOnce) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  ASSERT_TRUE(session_->WaitForChunks(4));

  feeder_->Stop();
  EXPECT_FALSE(feeder_->IsRunning());
  EXPECT_EQ(state_->close_calls.load(), 1);

  feeder_->Stop();
  feeder_.reset();
  EXPECT_EQ(state_->close_calls.load(), 1);
}

TEST_F(AudioFeederContractTests, NoChunksAfterStopReturns) {
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);
  ASSERT_TRUE(session_->WaitForChunks(2));

  feeder_->Stop();
  const size_t at_stop = session_->ChunkCount();
  const int decodes_at_stop = state_->decode_calls.load();
  EXPECT_EQ(session_->ChunkCount(), at_stop);
  EXPECT_EQ(state_->decode_calls.load(), decodes_at_stop);
}

// =============================================================================
// Unreachable sink
// =============================================================================

TEST_F(AudioFeederContractTests, UnreachableSinkDropsChunks) {
  session_->SetConnected(false);
  CreateFeeder(FakeSourceScript{});
  ASSERT_EQ(feeder_->Start(session_), FeederStartResult::kStarted);

  ASSERT_TRUE(EventuallyTrue([&] { return feeder_->Stats().chunks_dropped >= 3; }));
  feeder_->Stop();

  EXPECT_EQ(session_->ChunkCount(), 0u);
  EXPECT_EQ(feeder_->Stats().chunks_sent, 0u);
  EXPECT_EQ(feeder_->Stats().faults, 0u);
}

}  // namespace
}  // namespace gamecast::audio
