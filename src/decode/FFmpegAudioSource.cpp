// Repository: Gamecast-commentary
// Component: FFmpeg Audio Source
// Purpose: Audio extraction using libavformat/libavcodec/libswresample.
// Copyright (c) 2025 RetroVue

#include "gamecast/decode/FFmpegAudioSource.hpp"

#include <sstream>

#include "gamecast/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace {

// FFmpeg interrupt callback: return non-zero to abort I/O.
// Opaque is the address of FFmpegAudioSource::stop_, so a flag installed
// after Open() is still seen.
int InterruptCallback(void* opaque) {
  auto* slot = static_cast<std::atomic<bool>**>(opaque);
  if (*slot && (*slot)->load(std::memory_order_acquire)) {
    return 1;
  }
  return 0;
}

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

namespace gamecast::decode {

using gamecast::util::Logger;

const char* PacketResultToString(PacketResult result) {
  switch (result) {
    case PacketResult::kProgress: return "PROGRESS";
    case PacketResult::kEndOfStream: return "END_OF_STREAM";
    case PacketResult::kFault: return "FAULT";
    case PacketResult::kInterrupted: return "INTERRUPTED";
  }
  return "UNKNOWN";
}

FFmpegAudioSource::FFmpegAudioSource(std::string input_uri)
    : input_uri_(std::move(input_uri)) {}

FFmpegAudioSource::~FFmpegAudioSource() {
  Close();
}

void FFmpegAudioSource::SetInterruptFlag(std::atomic<bool>* stop) {
  stop_ = stop;
  if (format_ctx_) {
    format_ctx_->interrupt_callback.callback = stop_ ? InterruptCallback : nullptr;
    format_ctx_->interrupt_callback.opaque = stop_ ? &stop_ : nullptr;
  }
}

bool FFmpegAudioSource::Open() {
  Logger::Info("[FFmpegAudioSource] Opening: " + input_uri_);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Logger::Error("[FFmpegAudioSource] Failed to allocate format context");
    return false;
  }

  // Set interrupt callback so av_read_frame etc. abort promptly on stop.
  if (stop_) {
    format_ctx_->interrupt_callback.callback = InterruptCallback;
    format_ctx_->interrupt_callback.opaque = &stop_;
  }

  int ret = avformat_open_input(&format_ctx_, input_uri_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    Logger::Error("[FFmpegAudioSource] open_input FAILED uri=" + input_uri_ +
                  " ret=" + std::to_string(ret) + " err=" + AvErrorString(ret));
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioSource] find_stream_info FAILED uri=" + input_uri_ +
                  " err=" + AvErrorString(ret));
    Close();
    return false;
  }

  // Audio is optional: a video-only source opens fine and feeds nothing.
  ret = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (ret < 0) {
    audio_stream_index_ = -1;
    Logger::Info("[FFmpegAudioSource] No audio stream found in " + input_uri_);
    return true;
  }
  audio_stream_index_ = ret;

  AVStream* stream = format_ctx_->streams[audio_stream_index_];
  audio_time_base_ = av_q2d(stream->time_base);
  audio_start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  if (!InitializeAudioCodec()) {
    Logger::Error("[FFmpegAudioSource] initialize_audio_codec FAILED uri=" + input_uri_);
    Close();
    return false;
  }

  if (!InitializeResampler()) {
    Logger::Error("[FFmpegAudioSource] initialize_resampler FAILED uri=" + input_uri_);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegAudioSource] packet_alloc FAILED uri=" + input_uri_);
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[FFmpegAudioSource] open OK uri=" << input_uri_
      << " stream=" << audio_stream_index_
      << " src=" << SourceSampleRate() << "Hz/" << SourceChannels() << "ch"
      << " -> " << audio::kCanonicalSampleRate << "Hz/"
      << audio::kCanonicalChannels << "ch s16";
  Logger::Info(oss.str());
  return true;
}

bool FFmpegAudioSource::InitializeAudioCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[audio_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    Logger::Error("[FFmpegAudioSource] Audio codec not found: " +
                  std::to_string(static_cast<int>(codecpar->codec_id)));
    return false;
  }

  audio_codec_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_codec_ctx_) {
    Logger::Error("[FFmpegAudioSource] Failed to allocate audio codec context");
    return false;
  }

  if (avcodec_parameters_to_context(audio_codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegAudioSource] Failed to copy audio codec parameters");
    return false;
  }

  if (avcodec_open2(audio_codec_ctx_, codec, nullptr) < 0) {
    Logger::Error("[FFmpegAudioSource] Failed to open audio codec");
    return false;
  }

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    Logger::Error("[FFmpegAudioSource] Failed to allocate audio frame");
    return false;
  }

  return true;
}

bool FFmpegAudioSource::InitializeResampler() {
  if (!audio_codec_ctx_) {
    return false;
  }

  // Source layout: unspecified orders (raw PCM without a mask) get the
  // default layout for their channel count.
  AVChannelLayout src_ch_layout;
  av_channel_layout_uninit(&src_ch_layout);
  if (audio_codec_ctx_->ch_layout.nb_channels <= 0) {
    Logger::Error("[FFmpegAudioSource] Invalid channel count");
    return false;
  }
  if (audio_codec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&src_ch_layout, audio_codec_ctx_->ch_layout.nb_channels);
  } else if (av_channel_layout_copy(&src_ch_layout, &audio_codec_ctx_->ch_layout) < 0) {
    Logger::Error("[FFmpegAudioSource] Failed to copy source channel layout");
    return false;
  }

  // Target format: S16 interleaved, mono, 16 kHz
  AVChannelLayout dst_ch_layout;
  av_channel_layout_uninit(&dst_ch_layout);
  av_channel_layout_default(&dst_ch_layout, audio::kCanonicalChannels);

  if (swr_alloc_set_opts2(&swr_ctx_,
                          &dst_ch_layout, AV_SAMPLE_FMT_S16, audio::kCanonicalSampleRate,
                          &src_ch_layout, audio_codec_ctx_->sample_fmt,
                          audio_codec_ctx_->sample_rate,
                          0, nullptr) != 0) {
    Logger::Error("[FFmpegAudioSource] Failed to set resampler options");
    swr_free(&swr_ctx_);
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    return false;
  }

  // Clean up channel layouts (swr_alloc_set_opts2 copies them)
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);

  if (swr_init(swr_ctx_) < 0) {
    Logger::Error("[FFmpegAudioSource] Failed to initialize resampler");
    swr_free(&swr_ctx_);
    return false;
  }

  return true;
}

PacketResult FFmpegAudioSource::DecodeNextPacket(std::vector<audio::AudioChunk>& chunks) {
  if (!IsOpen() || audio_stream_index_ < 0) {
    return PacketResult::kFault;
  }
  if (eof_reached_) {
    return PacketResult::kEndOfStream;
  }

  while (true) {
    if (StopRequested()) {
      return PacketResult::kInterrupted;
    }

    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      return FlushAtEndOfStream(chunks);
    }
    if (ret < 0) {
      if (ret == AVERROR_EXIT || StopRequested()) {
        return PacketResult::kInterrupted;
      }
      stats_.decode_errors++;
      Logger::Error("[FFmpegAudioSource] read_frame FAILED uri=" + input_uri_ +
                    " err=" + AvErrorString(ret));
      return PacketResult::kFault;
    }

    // Video and data packets are skipped; the framework publishes video.
    if (packet_->stream_index != audio_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    stats_.packets_read++;
    ret = avcodec_send_packet(audio_codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0) {
      stats_.decode_errors++;
      Logger::Error("[FFmpegAudioSource] send_packet FAILED err=" + AvErrorString(ret));
      return PacketResult::kFault;
    }

    bool interrupted = false;
    if (!ReceiveFrames(chunks, interrupted)) {
      return interrupted ? PacketResult::kInterrupted : PacketResult::kFault;
    }
    return PacketResult::kProgress;
  }
}

bool FFmpegAudioSource::ReceiveFrames(std::vector<audio::AudioChunk>& chunks,
                                      bool& interrupted) {
  while (true) {
    int ret = avcodec_receive_frame(audio_codec_ctx_, audio_frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      Logger::Error("[FFmpegAudioSource] receive_frame FAILED err=" + AvErrorString(ret));
      return false;
    }

    stats_.frames_decoded++;
    bool converted = ConvertFrame(audio_frame_, chunks);
    av_frame_unref(audio_frame_);
    if (!converted) {
      return false;
    }

    if (StopRequested()) {
      interrupted = true;
      return false;
    }
  }
}

bool FFmpegAudioSource::ConvertFrame(AVFrame* av_frame,
                                     std::vector<audio::AudioChunk>& chunks) {
  if (!swr_ctx_) {
    return false;
  }

  const int src_rate = audio_codec_ctx_->sample_rate;
  const int in_samples = av_frame ? av_frame->nb_samples : 0;

  int64_t delay = swr_get_delay(swr_ctx_, src_rate);
  int64_t out_capacity = av_rescale_rnd(delay + in_samples,
                                        audio::kCanonicalSampleRate, src_rate,
                                        AV_ROUND_UP);
  if (out_capacity <= 0) {
    return true;
  }

  const int bytes_per_frame = audio::kCanonicalChannels * audio::kCanonicalBytesPerSample;

  audio::AudioChunk chunk;
  chunk.data.resize(static_cast<size_t>(out_capacity) * bytes_per_frame);
  uint8_t* out_data[1] = { chunk.data.data() };

  // Null input flushes the samples buffered inside the resampler.
  int converted = swr_convert(swr_ctx_,
                              out_data, static_cast<int>(out_capacity),
                              av_frame ? const_cast<const uint8_t**>(av_frame->extended_data)
                                       : nullptr,
                              in_samples);
  if (converted < 0) {
    stats_.decode_errors++;
    Logger::Error("[FFmpegAudioSource] Audio resampling failed err=" + AvErrorString(converted));
    return false;
  }
  if (converted == 0) {
    return true;
  }

  chunk.data.resize(static_cast<size_t>(converted) * bytes_per_frame);
  chunk.nb_samples = converted;
  chunk.sample_rate = audio::kCanonicalSampleRate;
  chunk.channels = audio::kCanonicalChannels;

  if (av_frame) {
    int64_t pts = av_frame->pts != AV_NOPTS_VALUE ? av_frame->pts
                                                  : av_frame->best_effort_timestamp;
    if (pts != AV_NOPTS_VALUE) {
      chunk.pts_us = static_cast<int64_t>(
          (pts - audio_start_time_) * audio_time_base_ * 1'000'000.0);
    }
  }

  stats_.samples_out += static_cast<uint64_t>(converted);
  chunks.push_back(std::move(chunk));
  return true;
}

PacketResult FFmpegAudioSource::FlushAtEndOfStream(std::vector<audio::AudioChunk>& chunks) {
  eof_reached_ = true;

  int ret = avcodec_send_packet(audio_codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    Logger::Warn("[FFmpegAudioSource] decoder drain refused err=" + AvErrorString(ret));
  }

  bool interrupted = false;
  if (!ReceiveFrames(chunks, interrupted)) {
    return interrupted ? PacketResult::kInterrupted : PacketResult::kFault;
  }
  if (!ConvertFrame(nullptr, chunks)) {
    return PacketResult::kFault;
  }

  Logger::Debug("[FFmpegAudioSource] end of stream uri=" + input_uri_ +
                " packets=" + std::to_string(stats_.packets_read) +
                " samples_out=" + std::to_string(stats_.samples_out));
  return PacketResult::kEndOfStream;
}

bool FFmpegAudioSource::SeekToStart() {
  if (!IsOpen() || audio_stream_index_ < 0) {
    return false;
  }

  AVStream* stream = format_ctx_->streams[audio_stream_index_];
  int64_t timestamp = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  int ret = av_seek_frame(format_ctx_, audio_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioSource] seek FAILED uri=" + input_uri_ +
                  " err=" + AvErrorString(ret));
    return false;
  }

  // The decoder was drained at EOF; flushing makes it accept packets again.
  avcodec_flush_buffers(audio_codec_ctx_);

  // Fresh resampler so no tail from the previous pass leaks into the next.
  swr_free(&swr_ctx_);
  if (!InitializeResampler()) {
    return false;
  }

  eof_reached_ = false;
  stats_.seeks++;
  return true;
}

void FFmpegAudioSource::Close() {
  if (!format_ctx_ && !audio_codec_ctx_ && !packet_ && !audio_frame_ && !swr_ctx_) {
    return;
  }

  Logger::Info("[FFmpegAudioSource] Closing uri=" + input_uri_);

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }

  if (audio_frame_) {
    av_frame_free(&audio_frame_);
  }

  if (audio_codec_ctx_) {
    avcodec_free_context(&audio_codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  audio_stream_index_ = -1;
  eof_reached_ = false;
}

int FFmpegAudioSource::SourceSampleRate() const {
  return audio_codec_ctx_ ? audio_codec_ctx_->sample_rate : 0;
}

int FFmpegAudioSource::SourceChannels() const {
  return audio_codec_ctx_ ? audio_codec_ctx_->ch_layout.nb_channels : 0;
}

}  // namespace gamecast::decode
