// Repository: Gamecast-commentary
// Component: Periodic Commentary Strategy
// Purpose: Fixed-cadence prompts on a dedicated thread.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_PERIODIC_COMMENTARY_HPP_
#define GAMECAST_COMMENTARY_PERIODIC_COMMENTARY_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "gamecast/commentary/ICommentaryStrategy.hpp"
#include "gamecast/commentary/PromptCatalog.hpp"
#include "gamecast/config/SessionConfig.hpp"
#include "gamecast/session/IVoiceSession.hpp"
#include "gamecast/timing/IWaitStrategy.hpp"

namespace gamecast::commentary {

// Timeline (S = startup delay, P = settle delay, I = interval):
//
//   t = S          opening prompt
//   t = S+P        regular prompt
//   t = S+P+k*I    regular prompt, k = 1, 2, ...
//
// A delivery fault replaces the next interval with the fault backoff. An
// unreachable session drops the prompt and keeps the cadence. A slow
// delivery delays the following wait but never skips a prompt.
//
// Every wait is a cancellation point; Stop() interrupts the pending wait and
// joins the thread.
class PeriodicCommentary : public ICommentaryStrategy {
 public:
  PeriodicCommentary(config::PeriodicTimings timings,
                     PromptSet prompts,
                     uint32_t seed,
                     std::shared_ptr<session::IVoiceSession> session,
                     std::unique_ptr<timing::IWaitStrategy> wait);
  ~PeriodicCommentary() override;

  PeriodicCommentary(const PeriodicCommentary&) = delete;
  PeriodicCommentary& operator=(const PeriodicCommentary&) = delete;

  const char* Name() const override { return "periodic"; }
  bool Start() override;
  void Stop() override;
  bool IsRunning() const override { return running_.load(std::memory_order_acquire); }
  bool OnDetection(const DetectionEvent& event) override;
  uint64_t PromptsDelivered() const override {
    return delivered_.load(std::memory_order_relaxed);
  }

  uint64_t DeliveryFaults() const { return faults_.load(std::memory_order_relaxed); }

 private:
  void Run();

  // Delivers one prompt and updates counters. Returns true on a fault.
  bool DeliverAndCount(const std::string& text);

  const config::PeriodicTimings timings_;
  const std::string opening_;
  PromptPicker picker_;  // Worker thread only
  std::shared_ptr<session::IVoiceSession> session_;
  std::unique_ptr<timing::IWaitStrategy> wait_;

  std::mutex lifecycle_mutex_;
  bool started_ = false;
  std::thread thread_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> faults_{0};
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_PERIODIC_COMMENTARY_HPP_
