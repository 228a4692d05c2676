// Repository: Gamecast-commentary
// Component: IVoiceSession Interface
// Purpose: Outbound surface of the realtime voice session. Written by both
//          the AudioFeeder (audio) and the CommentaryScheduler (prompts).
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_SESSION_IVOICE_SESSION_HPP_
#define GAMECAST_SESSION_IVOICE_SESSION_HPP_

#include <string>

#include "gamecast/audio/AudioTypes.hpp"

namespace gamecast::session {

// IVoiceSession is an append-only channel toward the voice model.
//
// Writers check IsConnected() before each send and drop the item when the
// session is unreachable; nothing is buffered for later, because stale audio
// or a stale prompt is worse than none.
//
// Both send calls must return promptly: they hand the item over and do not
// wait for the model to respond.
//
// Thread Safety: implementations must accept calls from the feeder thread,
// the periodic commentary thread and gRPC handler threads concurrently.
class IVoiceSession {
 public:
  virtual ~IVoiceSession() = default;

  virtual bool IsConnected() const = 0;

  // Hands one chunk plus its format tag to the session. Returns false if the
  // session refused the chunk.
  virtual bool SendAudio(const audio::AudioChunk& chunk,
                         const std::string& mime_type) = 0;

  // Hands one text prompt to the session. Returns false on delivery fault.
  // May also throw std::exception on transport failure; callers treat both
  // as a delivery fault.
  virtual bool SendPrompt(const std::string& text) = 0;
};

}  // namespace gamecast::session

#endif  // GAMECAST_SESSION_IVOICE_SESSION_HPP_
