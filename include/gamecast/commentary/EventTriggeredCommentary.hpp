// Repository: Gamecast-commentary
// Component: Event-Triggered Commentary Strategy
// Purpose: Detection-driven prompts gated by an opening, a cooldown and a
//          debouncer.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_EVENT_TRIGGERED_COMMENTARY_HPP_
#define GAMECAST_COMMENTARY_EVENT_TRIGGERED_COMMENTARY_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "gamecast/commentary/Debouncer.hpp"
#include "gamecast/commentary/ICommentaryStrategy.hpp"
#include "gamecast/commentary/PromptCatalog.hpp"
#include "gamecast/session/IVoiceSession.hpp"
#include "gamecast/timing/ITimeSource.hpp"

namespace gamecast::commentary {

// Phase of the event-triggered state machine. Transitions only move forward.
enum class CommentaryPhase {
  kAwaitingOpening,  // Next event (any content) delivers the opening
  kCoolingDown,      // Events ignored until cooldown has elapsed
  kActive,           // Qualifying events prompt, subject to the debouncer
};

const char* CommentaryPhaseToString(CommentaryPhase phase);

// Explicit state owned by the strategy; mutated only inside OnDetection().
struct CommentaryState {
  CommentaryPhase phase = CommentaryPhase::kAwaitingOpening;
  int64_t opening_delivered_ms = 0;
};

struct EventTriggerParams {
  int64_t cooldown_ms = 0;
  int64_t debounce_ms = 0;
  QualifyingPredicate qualifies;
};

// AWAITING_OPENING → COOLING_DOWN on the first event after Start(); the
// opening is sent and its time recorded. COOLING_DOWN ignores events (the
// debouncer is not consulted) until cooldown_ms has passed since the opening;
// the event that observes the elapsed cooldown moves the machine to ACTIVE
// and is then handled as an ACTIVE event. ACTIVE is terminal: an event
// prompts iff it qualifies and the debouncer grants.
//
// Delivery: SinkUnreachable drops the prompt; a delivery fault is logged and
// swallowed for that event. The opening counts as delivered for state
// purposes either way, so a failed opening never blocks regular commentary.
//
// Event delivery contract: OnDetection() may be called from several threads
// (gRPC handlers); the whole handler body runs under one mutex, so the state
// machine and the debouncer see events strictly one at a time.
class EventTriggeredCommentary : public ICommentaryStrategy {
 public:
  EventTriggeredCommentary(EventTriggerParams params,
                           PromptSet prompts,
                           uint32_t seed,
                           std::shared_ptr<session::IVoiceSession> session,
                           std::shared_ptr<timing::ITimeSource> time_source);

  EventTriggeredCommentary(const EventTriggeredCommentary&) = delete;
  EventTriggeredCommentary& operator=(const EventTriggeredCommentary&) = delete;

  const char* Name() const override { return "event"; }
  bool Start() override;
  void Stop() override;
  bool IsRunning() const override { return running_.load(std::memory_order_acquire); }
  bool OnDetection(const DetectionEvent& event) override;
  uint64_t PromptsDelivered() const override {
    return delivered_.load(std::memory_order_relaxed);
  }

  CommentaryState State() const;

 private:
  bool Deliver(const std::string& text);

  const int64_t cooldown_ms_;
  QualifyingPredicate qualifies_;
  const std::string opening_;
  std::shared_ptr<session::IVoiceSession> session_;
  std::shared_ptr<timing::ITimeSource> time_source_;

  mutable std::mutex handler_mutex_;
  CommentaryState state_;
  Debouncer debouncer_;
  PromptPicker picker_;
  bool started_ = false;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> delivered_{0};
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_EVENT_TRIGGERED_COMMENTARY_HPP_
