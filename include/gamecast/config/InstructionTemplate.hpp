// Repository: Gamecast-commentary
// Component: Instruction Template
// Purpose: Placeholder substitution for the voice-session instructions.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_CONFIG_INSTRUCTION_TEMPLATE_HPP_
#define GAMECAST_CONFIG_INSTRUCTION_TEMPLATE_HPP_

#include <string>

#include "gamecast/config/SessionConfig.hpp"

namespace gamecast::config {

// Replaces every occurrence of the known placeholders:
//   {FAV_TEAM_NAME}    favorite team, or "not specified"
//   {KNOWLEDGE_LEVEL}  capitalized level ("Beginner")
//   {COMMENTARY_STYLE} capitalized style ("Roasting")
//   {TEAM1_NAME} {TEAM2_NAME} {TEAM1_COLOR} {TEAM2_COLOR}
// Unknown placeholders are left as they are.
std::string RenderInstructions(const std::string& instructions_template,
                               const SessionConfig& config);

// Replaces every occurrence of `token` in `text`. Exposed for tests.
std::string ReplaceAll(std::string text, const std::string& token,
                       const std::string& value);

}  // namespace gamecast::config

#endif  // GAMECAST_CONFIG_INSTRUCTION_TEMPLATE_HPP_
