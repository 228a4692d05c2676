// Repository: Gamecast-commentary
// Component: FFmpeg Audio Source
// Purpose: Audio extraction using libavformat/libavcodec/libswresample.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_DECODE_FFMPEG_AUDIO_SOURCE_HPP_
#define GAMECAST_DECODE_FFMPEG_AUDIO_SOURCE_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "gamecast/decode/IAudioPacketSource.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace gamecast::decode {

// AudioSourceStats tracks demux/decode progress and errors.
struct AudioSourceStats {
  uint64_t packets_read = 0;
  uint64_t frames_decoded = 0;
  uint64_t samples_out = 0;
  uint64_t decode_errors = 0;
  uint64_t seeks = 0;
};

// FFmpegAudioSource demuxes the best audio stream of a container, decodes it
// and converts every frame to the canonical format (16 kHz, mono, S16).
//
// Resampling is always applied, including for sources that are already
// canonical; swresample passes such input through unchanged.
//
// Thread Safety:
// - Not thread-safe: use from the feeder thread only
// - The interrupt flag may be set from any thread
//
// Error Handling:
// - Open() returns false when the container cannot be opened or the audio
//   decoder cannot be initialized
// - A source without an audio stream opens successfully; HasAudioStream()
//   reports false
// - Mid-stream failures return PacketResult::kFault and bump decode_errors
class FFmpegAudioSource : public IAudioPacketSource {
 public:
  explicit FFmpegAudioSource(std::string input_uri);
  ~FFmpegAudioSource() override;

  FFmpegAudioSource(const FFmpegAudioSource&) = delete;
  FFmpegAudioSource& operator=(const FFmpegAudioSource&) = delete;

  void SetInterruptFlag(std::atomic<bool>* stop) override;
  bool Open() override;
  bool HasAudioStream() const override { return audio_stream_index_ >= 0; }
  PacketResult DecodeNextPacket(std::vector<audio::AudioChunk>& chunks) override;
  bool SeekToStart() override;
  void Close() override;
  bool IsOpen() const override { return format_ctx_ != nullptr; }

  const AudioSourceStats& GetStats() const { return stats_; }
  const std::string& InputUri() const { return input_uri_; }

  // Native format of the audio stream (valid after Open() with audio).
  int SourceSampleRate() const;
  int SourceChannels() const;

 private:
  bool InitializeAudioCodec();
  bool InitializeResampler();

  // Drains every frame the decoder has ready. Returns false on decode error
  // or when the stop flag is observed (interrupted set).
  bool ReceiveFrames(std::vector<audio::AudioChunk>& chunks, bool& interrupted);

  // Converts one decoded frame (or flushes the resampler when av_frame is null).
  bool ConvertFrame(AVFrame* av_frame, std::vector<audio::AudioChunk>& chunks);

  // Sends the end-of-stream marker to the decoder and flushes the resampler.
  PacketResult FlushAtEndOfStream(std::vector<audio::AudioChunk>& chunks);

  bool StopRequested() const {
    return stop_ != nullptr && stop_->load(std::memory_order_acquire);
  }

  std::string input_uri_;
  AudioSourceStats stats_;
  std::atomic<bool>* stop_ = nullptr;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* audio_codec_ctx_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  ::SwrContext* swr_ctx_ = nullptr;

  int audio_stream_index_ = -1;
  bool eof_reached_ = false;

  int64_t audio_start_time_ = 0;
  double audio_time_base_ = 0.0;
};

}  // namespace gamecast::decode

#endif  // GAMECAST_DECODE_FFMPEG_AUDIO_SOURCE_HPP_
