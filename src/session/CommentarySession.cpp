// Repository: Gamecast-commentary
// Component: CommentarySession Implementation
// Copyright (c) 2025 RetroVue

#include "gamecast/session/CommentarySession.hpp"

#include "gamecast/decode/FFmpegAudioSource.hpp"
#include "gamecast/util/Logger.hpp"

namespace gamecast::session {

using gamecast::util::Logger;

const char* TrackKindToString(TrackKind kind) {
  switch (kind) {
    case TrackKind::kAudio: return "audio";
    case TrackKind::kVideo: return "video";
  }
  return "unknown";
}

SessionDependencies SessionDependencies::Production() {
  SessionDependencies deps;
  deps.time_source = std::make_shared<timing::SystemTimeSource>();
  auto time_source = deps.time_source;
  deps.wait_factory = [time_source]() -> std::unique_ptr<timing::IWaitStrategy> {
    return std::make_unique<timing::RealtimeWaitStrategy>(time_source);
  };
  deps.source_factory = [](const std::string& uri)
      -> std::unique_ptr<decode::IAudioPacketSource> {
    return std::make_unique<decode::FFmpegAudioSource>(uri);
  };
  return deps;
}

CommentarySession::CommentarySession(std::string session_id,
                                     config::SessionConfig config,
                                     std::shared_ptr<IVoiceSession> voice,
                                     SessionDependencies deps)
    : session_id_(std::move(session_id)),
      config_(std::move(config)),
      voice_(std::move(voice)),
      deps_(std::move(deps)) {}

CommentarySession::~CommentarySession() {
  End();
}

bool CommentarySession::Started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

bool CommentarySession::Ended() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ended_;
}

SessionResult CommentarySession::HandleEvent(const SessionEvent& event) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (ended_) {
    return SessionResult{false, "session " + session_id_ + " has ended"};
  }
  if (const auto* signal = std::get_if<TrackSignal>(&event)) {
    return OnTrackSignal(*signal, lock);
  }
  return OnDetectionEvent(std::get<commentary::DetectionEvent>(event));
}

SessionResult CommentarySession::OnTrackSignal(const TrackSignal& signal,
                                                std::unique_lock<std::mutex>& lock) {
  if (signal.kind != TrackKind::kVideo) {
    Logger::Debug("[CommentarySession] " + session_id_ + " ignoring " +
                  TrackKindToString(signal.kind) + " track");
    return SessionResult{true, "ignored"};
  }
  if (started_) {
    return SessionResult{true, "already started"};
  }
  Logger::Info("[CommentarySession] " + session_id_ +
               " video track detected - starting commentary");
  return StartLocked(lock);
}

SessionResult CommentarySession::StartLocked(std::unique_lock<std::mutex>& lock) {
  started_ = true;
  SessionResult result{true, "started"};

  if (!config_.feed.source_uri.empty()) {
    audio::AudioFeederConfig feed;
    feed.source_uri = config_.feed.source_uri;
    feed.fault_backoff_ms = config_.feed.fault_backoff_ms;
    feed.packet_yield_ms = config_.feed.packet_yield_ms;
    feed.pace_realtime = config_.feed.pace_realtime;

    feeder_ = std::make_unique<audio::AudioFeeder>(
        std::move(feed), deps_.source_factory, deps_.wait_factory(), deps_.time_source);
    audio::AudioFeeder* feeder = feeder_.get();

    // Opening a live source can stall. End() must be able to stop the
    // feeder meanwhile, so the open runs without mutex_.
    lock.unlock();
    audio::FeederStartResult feed_result = feeder->Start(voice_);
    lock.lock();

    if (ended_) {
      Logger::Info("[CommentarySession] " + session_id_ + " ended while opening the media source");
      return SessionResult{false, "session " + session_id_ + " has ended"};
    }
    if (feed_result == audio::FeederStartResult::kSourceUnavailable) {
      result.ok = false;
      result.message = "media source unavailable: " + config_.feed.source_uri;
    }
  } else {
    Logger::Info("[CommentarySession] " + session_id_ + " no media source, audio feed disabled");
  }

  scheduler_ = commentary::CommentaryScheduler::Create(
      config_, voice_, deps_.wait_factory, deps_.time_source);
  scheduler_->Start();
  return result;
}

SessionResult CommentarySession::OnDetectionEvent(const commentary::DetectionEvent& event) {
  if (!scheduler_) {
    return SessionResult{true, "not started"};
  }
  SessionResult result;
  result.prompt_delivered = scheduler_->OnDetection(event);
  result.message = result.prompt_delivered ? "prompt delivered" : "no prompt";
  return result;
}

void CommentarySession::End() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ended_) {
    return;
  }
  ended_ = true;

  if (scheduler_) {
    scheduler_->Stop();
  }
  if (feeder_) {
    feeder_->Stop();
  }
  Logger::Info("[CommentarySession] " + session_id_ + " ended prompts=" +
               std::to_string(scheduler_ ? scheduler_->PromptsDelivered() : 0) +
               " chunks_sent=" +
               std::to_string(feeder_ ? feeder_->Stats().chunks_sent : 0));
}

}  // namespace gamecast::session
