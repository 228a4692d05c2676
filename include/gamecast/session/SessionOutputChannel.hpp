// Repository: Gamecast-commentary
// Component: SessionOutputChannel
// Purpose: Bounded hand-off from the engine to the host's output stream.
//          Implements IVoiceSession on the engine side.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_SESSION_SESSION_OUTPUT_CHANNEL_HPP_
#define GAMECAST_SESSION_SESSION_OUTPUT_CHANNEL_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "gamecast/audio/AudioTypes.hpp"
#include "gamecast/session/IVoiceSession.hpp"

namespace gamecast::session {

struct SessionOutputItem {
  enum class Kind { kAudio, kPrompt };

  Kind kind = Kind::kAudio;
  audio::AudioChunk chunk;  // kAudio
  std::string mime_type;    // kAudio
  std::string text;         // kPrompt
};

enum class PopResult {
  kItem,
  kTimeout,
  kClosed,  // Channel closed and drained
};

struct OutputChannelStats {
  uint64_t audio_queued = 0;
  uint64_t prompts_queued = 0;
  uint64_t audio_dropped = 0;   // Evicted or refused while full
  uint64_t prompts_dropped = 0; // Evicted only when the queue held no audio
};

// The channel is reachable (IsConnected) only while the host reports the
// voice link up AND one subscriber is attached AND the channel is open.
//
// Push never blocks. When the queue is full the oldest audio item is
// evicted first; a prompt evicts the oldest prompt only if no audio is left.
// Audio arriving at a queue full of prompts is refused.
//
// Thread Safety: all methods are safe from any thread. Pop() is meant for a
// single consumer (the subscriber stream).
class SessionOutputChannel : public IVoiceSession {
 public:
  static constexpr size_t kDefaultCapacity = 256;

  explicit SessionOutputChannel(size_t capacity = kDefaultCapacity);

  SessionOutputChannel(const SessionOutputChannel&) = delete;
  SessionOutputChannel& operator=(const SessionOutputChannel&) = delete;

  // IVoiceSession
  bool IsConnected() const override;
  bool SendAudio(const audio::AudioChunk& chunk, const std::string& mime_type) override;
  bool SendPrompt(const std::string& text) override;

  void SetVoiceLink(bool connected);

  // Returns false if a subscriber is already attached or the channel is closed.
  bool AttachSubscriber();
  void DetachSubscriber();

  // Waits up to timeout_ms for an item.
  PopResult Pop(SessionOutputItem* out, int64_t timeout_ms);

  // Wakes the consumer; later pushes are refused. Idempotent.
  void Close();
  bool IsClosed() const;

  size_t Size() const;
  size_t Capacity() const { return capacity_; }
  OutputChannelStats Stats() const;

 private:
  bool IsConnectedLocked() const;

  // Removes the oldest audio item. Returns false if there is none.
  bool EvictOldestAudioLocked();

  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SessionOutputItem> queue_;
  bool voice_link_up_ = false;
  bool subscriber_attached_ = false;
  bool closed_ = false;
  OutputChannelStats stats_;
};

}  // namespace gamecast::session

#endif  // GAMECAST_SESSION_SESSION_OUTPUT_CHANNEL_HPP_
