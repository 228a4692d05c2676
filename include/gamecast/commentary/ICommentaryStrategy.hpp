// Repository: Gamecast-commentary
// Component: ICommentaryStrategy
// Purpose: Common lifecycle of the periodic and event-triggered policies.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_ICOMMENTARY_STRATEGY_HPP_
#define GAMECAST_COMMENTARY_ICOMMENTARY_STRATEGY_HPP_

#include <cstdint>

#include "gamecast/commentary/CommentaryTypes.hpp"

namespace gamecast::commentary {

class ICommentaryStrategy {
 public:
  virtual ~ICommentaryStrategy() = default;

  virtual const char* Name() const = 0;

  // Idempotent. Returns true only for the call that actually started it.
  virtual bool Start() = 0;

  // Cooperative cancellation; returns once the strategy has gone quiet.
  // Safe to call repeatedly and before Start().
  virtual void Stop() = 0;

  virtual bool IsRunning() const = 0;

  // Detection input. Returns true if a prompt was delivered for this event.
  // Strategies that do not react to detections return false.
  virtual bool OnDetection(const DetectionEvent& event) = 0;

  virtual uint64_t PromptsDelivered() const = 0;
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_ICOMMENTARY_STRATEGY_HPP_
