// Repository: Gamecast-commentary
// Component: Event-Triggered Commentary Strategy
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/EventTriggeredCommentary.hpp"

#include "gamecast/commentary/PromptDelivery.hpp"
#include "gamecast/util/Logger.hpp"

namespace gamecast::commentary {

using gamecast::util::Logger;

namespace {
constexpr const char* kTag = "[EventCommentary]";
}  // namespace

const char* CommentaryPhaseToString(CommentaryPhase phase) {
  switch (phase) {
    case CommentaryPhase::kAwaitingOpening: return "AWAITING_OPENING";
    case CommentaryPhase::kCoolingDown: return "COOLING_DOWN";
    case CommentaryPhase::kActive: return "ACTIVE";
  }
  return "UNKNOWN";
}

EventTriggeredCommentary::EventTriggeredCommentary(
    EventTriggerParams params,
    PromptSet prompts,
    uint32_t seed,
    std::shared_ptr<session::IVoiceSession> session,
    std::shared_ptr<timing::ITimeSource> time_source)
    : cooldown_ms_(params.cooldown_ms),
      qualifies_(std::move(params.qualifies)),
      opening_(std::move(prompts.opening)),
      session_(std::move(session)),
      time_source_(time_source),
      debouncer_(params.debounce_ms, time_source),
      picker_(std::move(prompts.prompts), seed) {}

bool EventTriggeredCommentary::Start() {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  if (started_) {
    return false;
  }
  started_ = true;
  running_.store(true, std::memory_order_release);
  Logger::Info(std::string(kTag) + " Armed, awaiting first detection");
  return true;
}

void EventTriggeredCommentary::Stop() {
  // Taking the handler lock waits out an in-flight event.
  std::lock_guard<std::mutex> lock(handler_mutex_);
  if (running_.exchange(false, std::memory_order_acq_rel)) {
    Logger::Info(std::string(kTag) + " Stopped in phase " +
                 CommentaryPhaseToString(state_.phase) +
                 " delivered=" + std::to_string(PromptsDelivered()));
  }
}

CommentaryState EventTriggeredCommentary::State() const {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  return state_;
}

bool EventTriggeredCommentary::Deliver(const std::string& text) {
  if (DeliverPrompt(session_.get(), text, kTag) == DeliveryOutcome::kDelivered) {
    delivered_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }
  return false;
}

bool EventTriggeredCommentary::OnDetection(const DetectionEvent& event) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return false;
  }

  switch (state_.phase) {
    case CommentaryPhase::kAwaitingOpening: {
      bool delivered = Deliver(opening_);
      state_.opening_delivered_ms = time_source_->NowMs();
      state_.phase = CommentaryPhase::kCoolingDown;
      Logger::Info(std::string(kTag) + " Opening sent, cooling down for " +
                   std::to_string(cooldown_ms_) + "ms");
      return delivered;
    }

    case CommentaryPhase::kCoolingDown:
      if (time_source_->NowMs() - state_.opening_delivered_ms < cooldown_ms_) {
        return false;
      }
      state_.phase = CommentaryPhase::kActive;
      Logger::Info(std::string(kTag) + " Cooldown elapsed, commentary active");
      [[fallthrough]];

    case CommentaryPhase::kActive:
      if (!qualifies_ || !qualifies_(event)) {
        return false;
      }
      if (!debouncer_.TryAcquire()) {
        return false;
      }
      return Deliver(picker_.Pick());
  }
  return false;
}

}  // namespace gamecast::commentary
