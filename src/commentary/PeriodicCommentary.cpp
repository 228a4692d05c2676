// Repository: Gamecast-commentary
// Component: Periodic Commentary Strategy
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/PeriodicCommentary.hpp"

#include "gamecast/commentary/PromptDelivery.hpp"
#include "gamecast/util/Logger.hpp"

namespace gamecast::commentary {

using gamecast::util::Logger;

namespace {
constexpr const char* kTag = "[PeriodicCommentary]";
}  // namespace

PeriodicCommentary::PeriodicCommentary(config::PeriodicTimings timings,
                                       PromptSet prompts,
                                       uint32_t seed,
                                       std::shared_ptr<session::IVoiceSession> session,
                                       std::unique_ptr<timing::IWaitStrategy> wait)
    : timings_(timings),
      opening_(std::move(prompts.opening)),
      picker_(std::move(prompts.prompts), seed),
      session_(std::move(session)),
      wait_(std::move(wait)) {}

PeriodicCommentary::~PeriodicCommentary() {
  Stop();
}

bool PeriodicCommentary::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    return false;
  }
  started_ = true;
  if (wait_->Interrupted()) {
    return false;
  }
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&PeriodicCommentary::Run, this);
  return true;
}

void PeriodicCommentary::Stop() {
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

bool PeriodicCommentary::OnDetection(const DetectionEvent& /*event*/) {
  return false;
}

bool PeriodicCommentary::DeliverAndCount(const std::string& text) {
  DeliveryOutcome outcome = DeliverPrompt(session_.get(), text, kTag);
  if (outcome == DeliveryOutcome::kDelivered) {
    delivered_.fetch_add(1, std::memory_order_relaxed);
  } else if (outcome == DeliveryOutcome::kFault) {
    faults_.fetch_add(1, std::memory_order_relaxed);
    return true;
  }
  return false;
}

void PeriodicCommentary::Run() {
  Logger::Info(std::string(kTag) + " Starting commentary loop");

  if (wait_->WaitFor(timings_.startup_delay_ms)) {
    // An opening fault is logged and the schedule carries on.
    DeliverAndCount(opening_);

    if (wait_->WaitFor(timings_.settle_delay_ms)) {
      while (true) {
        bool faulted = DeliverAndCount(picker_.Pick());
        int64_t next_wait_ms = faulted ? timings_.fault_backoff_ms : timings_.interval_ms;
        if (!wait_->WaitFor(next_wait_ms)) {
          break;
        }
      }
    }
  }

  running_.store(false, std::memory_order_release);
  Logger::Info(std::string(kTag) + " Commentary loop stopped delivered=" +
               std::to_string(PromptsDelivered()) +
               " faults=" + std::to_string(DeliveryFaults()));
}

}  // namespace gamecast::commentary
