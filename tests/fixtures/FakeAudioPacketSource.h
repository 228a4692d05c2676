// Scripted audio source for AudioFeeder contract tests.
// Each packet yields one 100 ms chunk whose payload is the packet label, so
// emission order can be read straight off the recorded chunks. Shared state
// outlives the source so tests can inspect it after the feeder released it.

#ifndef GAMECAST_TESTS_FIXTURES_FAKE_AUDIO_PACKET_SOURCE_H_
#define GAMECAST_TESTS_FIXTURES_FAKE_AUDIO_PACKET_SOURCE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gamecast/audio/AudioTypes.hpp"
#include "gamecast/decode/IAudioPacketSource.hpp"

namespace gamecast::tests::fixtures {

struct FakeSourceScript {
  bool open_ok = true;
  bool has_audio = true;
  bool seek_ok = true;
  bool stall_open = false;        // Open() blocks until the interrupt flag is raised
  std::vector<std::string> packets = {"A", "B", "C"};
  int fault_on_decode_call = -1;  // 0-based DecodeNextPacket call that faults once
  int samples_per_chunk = 1600;   // 100 ms at 16 kHz
};

struct FakeSourceState {
  std::atomic<int> open_calls{0};
  std::atomic<int> close_calls{0};
  std::atomic<int> seek_calls{0};
  std::atomic<int> decode_calls{0};
  std::atomic<bool> interrupt_flag_installed{false};
  std::atomic<bool> open_stalling{false};
};

class FakeAudioPacketSource : public decode::IAudioPacketSource {
 public:
  FakeAudioPacketSource(FakeSourceScript script, std::shared_ptr<FakeSourceState> state)
      : script_(std::move(script)), state_(std::move(state)) {}

  void SetInterruptFlag(std::atomic<bool>* stop) override {
    stop_ = stop;
    state_->interrupt_flag_installed.store(stop != nullptr);
  }

  bool Open() override {
    state_->open_calls.fetch_add(1);
    if (script_.stall_open) {
      // Live-source stand-in: only the interrupt flag ends the open.
      state_->open_stalling.store(true);
      while (!(stop_ && stop_->load())) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      state_->open_stalling.store(false);
      return false;
    }
    open_ = script_.open_ok;
    return open_;
  }

  bool HasAudioStream() const override { return script_.has_audio; }

  decode::PacketResult DecodeNextPacket(std::vector<audio::AudioChunk>& chunks) override {
    const int call = state_->decode_calls.fetch_add(1);
    if (stop_ && stop_->load()) {
      return decode::PacketResult::kInterrupted;
    }
    if (call == script_.fault_on_decode_call) {
      return decode::PacketResult::kFault;
    }
    if (position_ >= script_.packets.size()) {
      return decode::PacketResult::kEndOfStream;
    }

    const std::string& label = script_.packets[position_];
    audio::AudioChunk chunk;
    chunk.data.assign(label.begin(), label.end());
    chunk.nb_samples = script_.samples_per_chunk;
    chunk.pts_us = static_cast<int64_t>(position_) * 100000;
    chunks.push_back(std::move(chunk));
    ++position_;
    return decode::PacketResult::kProgress;
  }

  bool SeekToStart() override {
    state_->seek_calls.fetch_add(1);
    if (!script_.seek_ok) {
      return false;
    }
    position_ = 0;
    return true;
  }

  void Close() override {
    if (!open_) {
      return;
    }
    open_ = false;
    state_->close_calls.fetch_add(1);
  }

  bool IsOpen() const override { return open_; }

  static std::string Label(const audio::AudioChunk& chunk) {
    return std::string(chunk.data.begin(), chunk.data.end());
  }

 private:
  FakeSourceScript script_;
  std::shared_ptr<FakeSourceState> state_;
  std::atomic<bool>* stop_ = nullptr;
  bool open_ = false;
  size_t position_ = 0;
};

// Factory handing out fresh sources that all report into `state`.
inline decode::AudioPacketSourceFactory MakeFakeSourceFactory(
    FakeSourceScript script, std::shared_ptr<FakeSourceState> state) {
  return [script, state](const std::string&) -> std::unique_ptr<decode::IAudioPacketSource> {
    return std::make_unique<FakeAudioPacketSource>(script, state);
  };
}

}  // namespace gamecast::tests::fixtures

#endif  // GAMECAST_TESTS_FIXTURES_FAKE_AUDIO_PACKET_SOURCE_H_
