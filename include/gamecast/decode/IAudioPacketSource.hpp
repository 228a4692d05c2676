// Repository: Gamecast-commentary
// Component: IAudioPacketSource
// Purpose: Minimal demux/decode/resample surface used by AudioFeeder so tests
//          can inject a fake source (loop, fault and stop contract tests).
//          Production uses FFmpegAudioSource; tests use FakeAudioPacketSource.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_DECODE_IAUDIO_PACKET_SOURCE_HPP_
#define GAMECAST_DECODE_IAUDIO_PACKET_SOURCE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gamecast/audio/AudioTypes.hpp"

namespace gamecast::decode {

// PacketResult separates end-of-stream and interruption from faults.
enum class PacketResult {
  kProgress,     // One packet demuxed and decoded (zero or more chunks produced)
  kEndOfStream,  // Source exhausted; decoder and resampler flushed into chunks
  kFault,        // Demux/decode/resample failure; the source stays usable
  kInterrupted,  // Stop flag observed mid-packet
};

const char* PacketResultToString(PacketResult result);

// Lifecycle:
// 1. SetInterruptFlag() (optional) so blocking reads abort on stop
// 2. Open(): false means the source could not be acquired at all
// 3. HasAudioStream(): false means video-only source (valid, nothing to feed)
// 4. DecodeNextPacket() repeatedly; SeekToStart() after kEndOfStream
// 5. Close(): idempotent
class IAudioPacketSource {
 public:
  virtual ~IAudioPacketSource() = default;

  virtual void SetInterruptFlag(std::atomic<bool>* stop) = 0;
  virtual bool Open() = 0;
  virtual bool HasAudioStream() const = 0;

  // Demuxes until one audio packet has been decoded, resamples every decoded
  // frame and appends one canonical chunk per resampled frame to `chunks`,
  // in playback order.
  virtual PacketResult DecodeNextPacket(std::vector<audio::AudioChunk>& chunks) = 0;

  // Rewinds to the first audio sample and resets decoder/resampler state.
  virtual bool SeekToStart() = 0;

  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

using AudioPacketSourceFactory =
    std::function<std::unique_ptr<IAudioPacketSource>(const std::string& uri)>;

}  // namespace gamecast::decode

#endif  // GAMECAST_DECODE_IAUDIO_PACKET_SOURCE_HPP_
