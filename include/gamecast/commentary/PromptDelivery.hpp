// Repository: Gamecast-commentary
// Component: Prompt Delivery
// Purpose: One place that turns a send attempt into an outcome, so both
//          strategies classify unreachable sinks and faults the same way.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_PROMPT_DELIVERY_HPP_
#define GAMECAST_COMMENTARY_PROMPT_DELIVERY_HPP_

#include <string>

#include "gamecast/session/IVoiceSession.hpp"

namespace gamecast::commentary {

enum class DeliveryOutcome {
  kDelivered,
  kUnreachable,  // Session not connected; prompt dropped, never retried
  kFault,        // Send refused or threw; already logged
};

const char* DeliveryOutcomeToString(DeliveryOutcome outcome);

// `origin` tags log lines ("[PeriodicCommentary]").
DeliveryOutcome DeliverPrompt(session::IVoiceSession* session,
                              const std::string& text,
                              const std::string& origin);

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_PROMPT_DELIVERY_HPP_
