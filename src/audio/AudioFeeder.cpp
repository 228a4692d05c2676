// Repository: Gamecast-commentary
// Component: AudioFeeder Implementation
// Copyright (c) 2025 RetroVue

#include "gamecast/audio/AudioFeeder.hpp"

#include <exception>
#include <sstream>

#include "gamecast/util/Logger.hpp"

namespace gamecast::audio {

using gamecast::util::Logger;

namespace {

// Closes the source when the feed thread unwinds, whatever the exit path.
class SourceCloser {
 public:
  explicit SourceCloser(decode::IAudioPacketSource* source) : source_(source) {}
  ~SourceCloser() {
    if (source_) {
      source_->Close();
    }
  }

  SourceCloser(const SourceCloser&) = delete;
  SourceCloser& operator=(const SourceCloser&) = delete;

 private:
  decode::IAudioPacketSource* source_;
};

}  // namespace

const char* FeederStartResultToString(FeederStartResult result) {
  switch (result) {
    case FeederStartResult::kStarted: return "STARTED";
    case FeederStartResult::kAlreadyStarted: return "ALREADY_STARTED";
    case FeederStartResult::kNoAudioTrack: return "NO_AUDIO_TRACK";
    case FeederStartResult::kSourceUnavailable: return "SOURCE_UNAVAILABLE";
    case FeederStartResult::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

AudioFeeder::AudioFeeder(AudioFeederConfig config,
                         decode::AudioPacketSourceFactory source_factory,
                         std::unique_ptr<timing::IWaitStrategy> wait,
                         std::shared_ptr<timing::ITimeSource> time_source)
    : config_(std::move(config)),
      source_factory_(std::move(source_factory)),
      wait_(std::move(wait)),
      time_source_(std::move(time_source)),
      mime_type_(CanonicalMimeType()) {}

AudioFeeder::~AudioFeeder() {
  Stop();
}

FeederStartResult AudioFeeder::Start(std::shared_ptr<session::IVoiceSession> sink) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    return FeederStartResult::kAlreadyStarted;
  }
  started_ = true;

  if (StopRequested()) {
    return FeederStartResult::kStopped;
  }

  sink_ = std::move(sink);
  source_ = source_factory_ ? source_factory_(config_.source_uri) : nullptr;
  if (!source_) {
    Logger::Error("[AudioFeeder] No source could be created for " + config_.source_uri);
    return FeederStartResult::kSourceUnavailable;
  }

  source_->SetInterruptFlag(&stop_requested_);
  if (!source_->Open()) {
    Logger::Error("[AudioFeeder] Source unavailable: " + config_.source_uri);
    return FeederStartResult::kSourceUnavailable;
  }

  if (!source_->HasAudioStream()) {
    Logger::Warn("[AudioFeeder] No audio track in " + config_.source_uri +
                 " - audio feed skipped");
    source_->Close();
    return FeederStartResult::kNoAudioTrack;
  }

  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&AudioFeeder::FeedLoop, this);
  return FeederStartResult::kStarted;
}

void AudioFeeder::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  wait_->Interrupt();

  std::thread to_join;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    to_join = std::move(thread_);
  }
  if (to_join.joinable()) {
    to_join.join();
  }
}

FeederStats AudioFeeder::Stats() const {
  FeederStats stats;
  stats.chunks_sent = chunks_sent_.load(std::memory_order_relaxed);
  stats.chunks_dropped = chunks_dropped_.load(std::memory_order_relaxed);
  stats.loops = loops_.load(std::memory_order_relaxed);
  stats.faults = faults_.load(std::memory_order_relaxed);
  return stats;
}

void AudioFeeder::ResetPacing() {
  pass_anchor_ms_ = time_source_->NowMs();
  pass_emitted_us_ = 0;
}

void AudioFeeder::FeedLoop() {
  SourceCloser closer(source_.get());
  Logger::Info("[AudioFeeder] Streaming audio from " + config_.source_uri);

  std::vector<AudioChunk> chunks;
  ResetPacing();

  bool keep_going = true;
  while (keep_going && !StopRequested()) {
    try {
      chunks.clear();
      decode::PacketResult result = source_->DecodeNextPacket(chunks);

      // Chunks decoded ahead of an end-of-stream or fault are still emitted,
      // so playback order is preserved up to the discontinuity.
      if (!EmitChunks(chunks)) {
        break;
      }

      switch (result) {
        case decode::PacketResult::kProgress:
          keep_going = wait_->WaitFor(config_.packet_yield_ms);
          break;

        case decode::PacketResult::kEndOfStream:
          if (!source_->SeekToStart()) {
            keep_going = BackOffAfterFault("seek to start failed");
            break;
          }
          loops_.fetch_add(1, std::memory_order_relaxed);
          keep_going = YieldAfterLoop();
          ResetPacing();
          break;

        case decode::PacketResult::kFault:
          keep_going = BackOffAfterFault("decode fault");
          break;

        case decode::PacketResult::kInterrupted:
          keep_going = false;
          break;
      }
    } catch (const std::exception& e) {
      keep_going = BackOffAfterFault(std::string("exception: ") + e.what());
    }
  }

  running_.store(false, std::memory_order_release);

  FeederStats stats = Stats();
  std::ostringstream oss;
  oss << "[AudioFeeder] Audio streaming stopped uri=" << config_.source_uri
      << " sent=" << stats.chunks_sent
      << " dropped=" << stats.chunks_dropped
      << " loops=" << stats.loops
      << " faults=" << stats.faults;
  Logger::Info(oss.str());
}

bool AudioFeeder::EmitChunks(const std::vector<AudioChunk>& chunks) {
  for (const auto& chunk : chunks) {
    if (StopRequested()) {
      return false;
    }

    if (config_.pace_realtime) {
      if (!wait_->WaitUntil(pass_anchor_ms_ + pass_emitted_us_ / 1000)) {
        return false;
      }
    }
    pass_emitted_us_ += chunk.DurationUs();
    ++pass_chunks_;

    // Unreachable sink: drop, never buffer. Fresh audio matters more than
    // complete audio.
    if (!sink_ || !sink_->IsConnected()) {
      chunks_dropped_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    if (sink_->SendAudio(chunk, mime_type_)) {
      chunks_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
      chunks_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  return true;
}

bool AudioFeeder::YieldAfterLoop() {
  const bool empty_pass = pass_chunks_ == 0;
  pass_chunks_ = 0;

  if (!empty_pass) {
    idle_passes_ = 0;
    Logger::Info("[AudioFeeder] Audio looped pass=" +
                 std::to_string(loops_.load(std::memory_order_relaxed)));
    return wait_->WaitFor(config_.packet_yield_ms);
  }

  // A pass that decoded nothing would otherwise spin on seek-to-start.
  if (idle_passes_++ == 0) {
    Logger::Warn("[AudioFeeder] No audio decoded in a full pass uri=" + config_.source_uri +
                 ", rechecking every " + std::to_string(config_.fault_backoff_ms) + "ms");
  }
  return wait_->WaitFor(config_.fault_backoff_ms);
}

bool AudioFeeder::BackOffAfterFault(const std::string& reason) {
  faults_.fetch_add(1, std::memory_order_relaxed);
  Logger::Error("[AudioFeeder] Audio stream error (" + reason + ") uri=" +
                config_.source_uri + ", retrying in " +
                std::to_string(config_.fault_backoff_ms) + "ms");
  if (!wait_->WaitFor(config_.fault_backoff_ms)) {
    return false;
  }
  ResetPacing();
  return true;
}

}  // namespace gamecast::audio
