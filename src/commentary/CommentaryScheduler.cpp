// Repository: Gamecast-commentary
// Component: CommentaryScheduler Implementation
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/CommentaryScheduler.hpp"

#include <stdexcept>

#include "gamecast/commentary/EventTriggeredCommentary.hpp"
#include "gamecast/commentary/PeriodicCommentary.hpp"
#include "gamecast/commentary/PromptCatalog.hpp"
#include "gamecast/util/Logger.hpp"

namespace gamecast::commentary {

using gamecast::util::Logger;

CommentaryScheduler::CommentaryScheduler(std::unique_ptr<ICommentaryStrategy> strategy)
    : strategy_(std::move(strategy)) {
  if (!strategy_) {
    throw std::invalid_argument("CommentaryScheduler requires a strategy");
  }
}

CommentaryScheduler::~CommentaryScheduler() {
  Stop();
}

std::unique_ptr<CommentaryScheduler> CommentaryScheduler::Create(
    const config::SessionConfig& config,
    std::shared_ptr<session::IVoiceSession> session,
    const timing::WaitStrategyFactory& wait_factory,
    std::shared_ptr<timing::ITimeSource> time_source) {
  PromptSet prompts = BuildPromptSet(config.style, config.level,
                                     config.team1, config.team2);

  std::unique_ptr<ICommentaryStrategy> strategy;
  switch (config.strategy) {
    case config::StrategyKind::kPeriodic:
      strategy = std::make_unique<PeriodicCommentary>(
          config.periodic, std::move(prompts), config.prompt_seed,
          std::move(session), wait_factory());
      break;

    case config::StrategyKind::kEventTriggered: {
      EventTriggerParams params;
      params.cooldown_ms = config.event.cooldown_ms;
      params.debounce_ms = config.event.debounce_ms;
      params.qualifies = MakeLabelPredicate(config.event.qualifying_label,
                                            config.event.min_confidence);
      strategy = std::make_unique<EventTriggeredCommentary>(
          std::move(params), std::move(prompts), config.prompt_seed,
          std::move(session), std::move(time_source));
      break;
    }
  }

  Logger::Info(std::string("[CommentaryScheduler] Strategy=") + strategy->Name() +
               " style=" + config::ToString(config.style) +
               " level=" + config::ToString(config.level));
  return std::make_unique<CommentaryScheduler>(std::move(strategy));
}

bool CommentaryScheduler::Start() {
  return strategy_->Start();
}

void CommentaryScheduler::Stop() {
  strategy_->Stop();
}

bool CommentaryScheduler::IsRunning() const {
  return strategy_->IsRunning();
}

bool CommentaryScheduler::OnDetection(const DetectionEvent& event) {
  return strategy_->OnDetection(event);
}

const char* CommentaryScheduler::StrategyName() const {
  return strategy_->Name();
}

uint64_t CommentaryScheduler::PromptsDelivered() const {
  return strategy_->PromptsDelivered();
}

}  // namespace gamecast::commentary
