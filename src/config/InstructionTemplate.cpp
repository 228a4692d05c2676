// Repository: Gamecast-commentary
// Component: Instruction Template
// Copyright (c) 2025 RetroVue

#include "gamecast/config/InstructionTemplate.hpp"

#include <cctype>

namespace gamecast::config {

namespace {

std::string Capitalize(std::string text) {
  if (!text.empty()) {
    text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  }
  return text;
}

}  // namespace

std::string ReplaceAll(std::string text, const std::string& token,
                       const std::string& value) {
  if (token.empty()) {
    return text;
  }
  size_t pos = text.find(token);
  while (pos != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos = text.find(token, pos + value.size());
  }
  return text;
}

std::string RenderInstructions(const std::string& instructions_template,
                               const SessionConfig& config) {
  std::string out = instructions_template;
  out = ReplaceAll(out, "{FAV_TEAM_NAME}",
                   config.favorite_team.empty() ? "not specified" : config.favorite_team);
  out = ReplaceAll(out, "{KNOWLEDGE_LEVEL}", Capitalize(ToString(config.level)));
  out = ReplaceAll(out, "{COMMENTARY_STYLE}", Capitalize(ToString(config.style)));
  out = ReplaceAll(out, "{TEAM1_NAME}", config.team1);
  out = ReplaceAll(out, "{TEAM2_NAME}", config.team2);
  out = ReplaceAll(out, "{TEAM1_COLOR}", config.team1_color);
  out = ReplaceAll(out, "{TEAM2_COLOR}", config.team2_color);
  return out;
}

}  // namespace gamecast::config
