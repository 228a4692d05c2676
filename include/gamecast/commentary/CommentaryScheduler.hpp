// Repository: Gamecast-commentary
// Component: CommentaryScheduler
// Purpose: Owns the session's single commentary strategy and builds it from
//          the session configuration.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_COMMENTARY_SCHEDULER_HPP_
#define GAMECAST_COMMENTARY_COMMENTARY_SCHEDULER_HPP_

#include <cstdint>
#include <memory>

#include "gamecast/commentary/ICommentaryStrategy.hpp"
#include "gamecast/config/SessionConfig.hpp"
#include "gamecast/session/IVoiceSession.hpp"
#include "gamecast/timing/ITimeSource.hpp"
#include "gamecast/timing/IWaitStrategy.hpp"

namespace gamecast::commentary {

// CommentaryScheduler is a thin owner around exactly one strategy. The
// session forwards detection events here regardless of the strategy kind;
// a periodic strategy simply ignores them.
class CommentaryScheduler {
 public:
  explicit CommentaryScheduler(std::unique_ptr<ICommentaryStrategy> strategy);
  ~CommentaryScheduler();

  CommentaryScheduler(const CommentaryScheduler&) = delete;
  CommentaryScheduler& operator=(const CommentaryScheduler&) = delete;

  // Builds the strategy named by config.strategy with the prompt set derived
  // from config.style / config.level / team names.
  static std::unique_ptr<CommentaryScheduler> Create(
      const config::SessionConfig& config,
      std::shared_ptr<session::IVoiceSession> session,
      const timing::WaitStrategyFactory& wait_factory,
      std::shared_ptr<timing::ITimeSource> time_source);

  bool Start();
  void Stop();
  bool IsRunning() const;

  // Returns true if a prompt was delivered for this event.
  bool OnDetection(const DetectionEvent& event);

  const char* StrategyName() const;
  uint64_t PromptsDelivered() const;

  ICommentaryStrategy* Strategy() const { return strategy_.get(); }

 private:
  std::unique_ptr<ICommentaryStrategy> strategy_;
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_COMMENTARY_SCHEDULER_HPP_
