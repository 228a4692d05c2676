// Repository: Gamecast-commentary
// Component: CommentarySession
// Purpose: Per-session orchestrator. Wires one AudioFeeder and one
//          CommentaryScheduler to the host's lifecycle and detection events.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_SESSION_COMMENTARY_SESSION_HPP_
#define GAMECAST_SESSION_COMMENTARY_SESSION_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

#include "gamecast/audio/AudioFeeder.hpp"
#include "gamecast/commentary/CommentaryScheduler.hpp"
#include "gamecast/commentary/CommentaryTypes.hpp"
#include "gamecast/config/SessionConfig.hpp"
#include "gamecast/decode/IAudioPacketSource.hpp"
#include "gamecast/session/IVoiceSession.hpp"
#include "gamecast/timing/ITimeSource.hpp"
#include "gamecast/timing/IWaitStrategy.hpp"

namespace gamecast::session {

enum class TrackKind {
  kAudio,
  kVideo,
};

const char* TrackKindToString(TrackKind kind);

struct TrackSignal {
  TrackKind kind = TrackKind::kVideo;
};

// Everything the host can tell a session, dispatched to one handler.
using SessionEvent = std::variant<TrackSignal, commentary::DetectionEvent>;

struct SessionResult {
  bool ok = true;
  std::string message;
  bool prompt_delivered = false;  // Detection events only
};

// Injection points for time, waiting and media. Production() wires the
// steady clock, realtime waits and FFmpeg.
struct SessionDependencies {
  std::shared_ptr<timing::ITimeSource> time_source;
  timing::WaitStrategyFactory wait_factory;
  decode::AudioPacketSourceFactory source_factory;

  static SessionDependencies Production();
};

// CommentarySession
//
// Lifecycle:
// - The first VideoTrackAdded starts the feeder (only when a media source is
//   configured) and the commentary scheduler. Both are started at most once
//   for the lifetime of the session; later VideoTrackAdded signals are
//   no-ops and AudioTrackAdded is ignored.
// - A media source that cannot be acquired is reported back as a failed
//   SessionResult. The scheduler is started regardless: commentary and audio
//   are independent.
// - Detection events are forwarded to the scheduler once started, dropped
//   before.
// - End() stops the feeder and the scheduler and is idempotent. Events after
//   End() are rejected.
//
// HandleEvent() may be called from several threads; the handler body is
// serialized by a mutex. The mutex is released while the media source opens,
// so End() can interrupt a stalled open.
class CommentarySession {
 public:
  CommentarySession(std::string session_id,
                    config::SessionConfig config,
                    std::shared_ptr<IVoiceSession> voice,
                    SessionDependencies deps);
  ~CommentarySession();

  CommentarySession(const CommentarySession&) = delete;
  CommentarySession& operator=(const CommentarySession&) = delete;

  SessionResult HandleEvent(const SessionEvent& event);

  SessionResult SignalTrack(TrackKind kind) { return HandleEvent(TrackSignal{kind}); }
  SessionResult ReportDetections(const commentary::DetectionEvent& event) {
    return HandleEvent(event);
  }

  void End();

  const std::string& Id() const { return session_id_; }
  const config::SessionConfig& Config() const { return config_; }
  bool Started() const;
  bool Ended() const;

  // Null until started (feeder also stays null without a media source).
  const audio::AudioFeeder* Feeder() const { return feeder_.get(); }
  const commentary::CommentaryScheduler* Scheduler() const { return scheduler_.get(); }

 private:
  SessionResult OnTrackSignal(const TrackSignal& signal, std::unique_lock<std::mutex>& lock);
  SessionResult OnDetectionEvent(const commentary::DetectionEvent& event);

  // Starts the feeder and the scheduler. Requires mutex_ held through lock;
  // drops it for the duration of the source open.
  SessionResult StartLocked(std::unique_lock<std::mutex>& lock);

  const std::string session_id_;
  const config::SessionConfig config_;
  std::shared_ptr<IVoiceSession> voice_;
  SessionDependencies deps_;

  mutable std::mutex mutex_;
  bool started_ = false;
  bool ended_ = false;
  std::unique_ptr<audio::AudioFeeder> feeder_;
  std::unique_ptr<commentary::CommentaryScheduler> scheduler_;
};

}  // namespace gamecast::session

#endif  // GAMECAST_SESSION_COMMENTARY_SESSION_HPP_
