// Repository: Gamecast-commentary
// Component: Prompt Delivery
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/PromptDelivery.hpp"

#include <exception>

#include "gamecast/util/Logger.hpp"

namespace gamecast::commentary {

using gamecast::util::Logger;

const char* DeliveryOutcomeToString(DeliveryOutcome outcome) {
  switch (outcome) {
    case DeliveryOutcome::kDelivered: return "DELIVERED";
    case DeliveryOutcome::kUnreachable: return "UNREACHABLE";
    case DeliveryOutcome::kFault: return "FAULT";
  }
  return "UNKNOWN";
}

DeliveryOutcome DeliverPrompt(session::IVoiceSession* session,
                              const std::string& text,
                              const std::string& origin) {
  if (!session || !session->IsConnected()) {
    Logger::Debug(origin + " voice session unreachable, prompt dropped: " + text);
    return DeliveryOutcome::kUnreachable;
  }

  try {
    if (!session->SendPrompt(text)) {
      Logger::Error(origin + " Commentary error: prompt refused by voice session");
      return DeliveryOutcome::kFault;
    }
  } catch (const std::exception& e) {
    Logger::Error(origin + " Commentary error: " + e.what());
    return DeliveryOutcome::kFault;
  }

  Logger::Info(origin + " prompt: " + text);
  return DeliveryOutcome::kDelivered;
}

}  // namespace gamecast::commentary
