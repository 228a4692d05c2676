// Repository: Gamecast-commentary
// Component: Audio Types
// Purpose: Canonical PCM format accepted by the voice session and the chunk
//          type handed from the feeder to the session sink.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_AUDIO_AUDIO_TYPES_HPP_
#define GAMECAST_AUDIO_AUDIO_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace gamecast::audio {

// Canonical format: 16 kHz, mono, signed 16-bit little-endian.
inline constexpr int kCanonicalSampleRate = 16000;
inline constexpr int kCanonicalChannels = 1;
inline constexpr int kCanonicalBitsPerSample = 16;
inline constexpr int kCanonicalBytesPerSample = kCanonicalBitsPerSample / 8;

// Format tag sent alongside every chunk.
inline std::string CanonicalMimeType() {
  return "audio/pcm;rate=" + std::to_string(kCanonicalSampleRate);
}

// One resampled segment of source audio. Immutable once emitted; the sink
// consumes it exactly once.
struct AudioChunk {
  std::vector<uint8_t> data;     // s16le interleaved (mono → one sample per frame)
  int sample_rate = kCanonicalSampleRate;
  int channels = kCanonicalChannels;
  int nb_samples = 0;            // Samples per channel
  int64_t pts_us = 0;            // Source timestamp of the first sample, 0 if unknown

  // Playback duration of this chunk in microseconds.
  int64_t DurationUs() const {
    if (sample_rate <= 0) return 0;
    return static_cast<int64_t>(nb_samples) * 1'000'000 / sample_rate;
  }
};

}  // namespace gamecast::audio

#endif  // GAMECAST_AUDIO_AUDIO_TYPES_HPP_
