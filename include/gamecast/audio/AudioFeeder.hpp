// Repository: Gamecast-commentary
// Component: AudioFeeder
// Purpose: Streams the audio track of a media source to the voice session as
//          canonical PCM chunks, paced at playback speed, looping forever.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_AUDIO_AUDIO_FEEDER_HPP_
#define GAMECAST_AUDIO_AUDIO_FEEDER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gamecast/audio/AudioTypes.hpp"
#include "gamecast/decode/IAudioPacketSource.hpp"
#include "gamecast/session/IVoiceSession.hpp"
#include "gamecast/timing/ITimeSource.hpp"
#include "gamecast/timing/IWaitStrategy.hpp"

namespace gamecast::audio {

struct AudioFeederConfig {
  std::string source_uri;
  int64_t fault_backoff_ms = 1000;  // Fixed pause after a demux/decode fault
  int64_t packet_yield_ms = 1;      // Pause after every packet
  bool pace_realtime = true;        // Emit chunks no faster than playback
};

enum class FeederStartResult {
  kStarted,            // Feed thread running
  kAlreadyStarted,     // Second Start(); no-op
  kNoAudioTrack,       // Source opened but has no audio; nothing will be fed
  kSourceUnavailable,  // Source could not be acquired (hard failure)
  kStopped,            // Stop() preceded Start()
};

const char* FeederStartResultToString(FeederStartResult result);

struct FeederStats {
  uint64_t chunks_sent = 0;
  uint64_t chunks_dropped = 0;  // Sink unreachable or refused
  uint64_t loops = 0;           // Completed passes over the source
  uint64_t faults = 0;
};

// AudioFeeder owns the media source for the lifetime of the session.
//
// Lifecycle:
// 1. Construct with config, source factory, wait strategy and time source
// 2. Start(sink) opens the source on the caller's thread. Open failure is
//    returned as kSourceUnavailable; a source without audio returns
//    kNoAudioTrack and is released immediately. Otherwise a feed thread is
//    started and kStarted returned.
// 3. The feed thread demuxes, decodes and resamples packet by packet and
//    emits every resampled segment as one chunk, in playback order. At end of
//    stream it seeks to the start, yields, and continues; a pass that produced
//    no audio waits the fault backoff instead. A fault is logged, followed
//    by one fixed backoff, after which feeding resumes.
// 4. Stop() raises the stop flag (checked per packet, per frame and per
//    chunk, and by the FFmpeg interrupt callback), interrupts any pending
//    wait and joins. The source is closed exactly once, by the feed thread,
//    on every exit path.
//
// Start() is single-assignment: only the first call has any effect.
class AudioFeeder {
 public:
  AudioFeeder(AudioFeederConfig config,
              decode::AudioPacketSourceFactory source_factory,
              std::unique_ptr<timing::IWaitStrategy> wait,
              std::shared_ptr<timing::ITimeSource> time_source);
  ~AudioFeeder();

  AudioFeeder(const AudioFeeder&) = delete;
  AudioFeeder& operator=(const AudioFeeder&) = delete;

  FeederStartResult Start(std::shared_ptr<session::IVoiceSession> sink);
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  FeederStats Stats() const;

  const AudioFeederConfig& Config() const { return config_; }

 private:
  void FeedLoop();

  // Emits chunks in order. Returns false if stop was requested.
  bool EmitChunks(const std::vector<AudioChunk>& chunks);

  // Pause after a loop restart: the packet yield after a pass that emitted
  // audio, the fault backoff after an empty one. Returns false if stopped.
  bool YieldAfterLoop();

  // Logs the fault and waits the fixed backoff. Returns false if stopped.
  bool BackOffAfterFault(const std::string& reason);

  // Restarts the pacing timeline (after a loop restart or a backoff).
  void ResetPacing();

  bool StopRequested() const {
    return stop_requested_.load(std::memory_order_acquire);
  }

  AudioFeederConfig config_;
  decode::AudioPacketSourceFactory source_factory_;
  std::unique_ptr<timing::IWaitStrategy> wait_;
  std::shared_ptr<timing::ITimeSource> time_source_;
  const std::string mime_type_;

  std::mutex lifecycle_mutex_;
  bool started_ = false;
  std::thread thread_;

  std::unique_ptr<decode::IAudioPacketSource> source_;
  std::shared_ptr<session::IVoiceSession> sink_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};

  // Feed-thread only
  int64_t pass_anchor_ms_ = 0;
  int64_t pass_emitted_us_ = 0;
  uint64_t pass_chunks_ = 0;    // Chunks since the last loop restart
  uint64_t idle_passes_ = 0;    // Consecutive passes without audio

  std::atomic<uint64_t> chunks_sent_{0};
  std::atomic<uint64_t> chunks_dropped_{0};
  std::atomic<uint64_t> loops_{0};
  std::atomic<uint64_t> faults_{0};
};

}  // namespace gamecast::audio

#endif  // GAMECAST_AUDIO_AUDIO_FEEDER_HPP_
