// Repository: Gamecast-commentary
// Component: Prompt Catalog
// Copyright (c) 2025 RetroVue

#include "gamecast/commentary/PromptCatalog.hpp"

#include <stdexcept>

namespace gamecast::commentary {

std::string OpeningPrompt(const std::string& team1, const std::string& team2) {
  return "Welcome to " + team1 + " vs " + team2 + "! Quick intro in 1-2 sentences.";
}

std::string LevelHint(KnowledgeLevel level) {
  switch (level) {
    case KnowledgeLevel::kBeginner: return "Explain terms simply.";
    case KnowledgeLevel::kIntermediate: return "Explain tactics.";
    case KnowledgeLevel::kExpert: return "Use jargon freely.";
  }
  return "";
}

std::vector<std::string> StyleTemplates(CommentaryStyle style) {
  if (IsRoasting(style)) {
    return {
        "What's happening? Roast it. 1-2 sentences.",
        "Comment on that play with roasts. 1-2 sentences.",
    };
  }
  return {
      "What's happening? 1-2 sentences.",
      "Comment on that play. 1-2 sentences.",
  };
}

std::string ComposePrompt(const std::string& style_template, const std::string& hint) {
  if (hint.empty()) {
    return style_template;
  }
  return style_template + " " + hint;
}

PromptSet BuildPromptSet(CommentaryStyle style, KnowledgeLevel level,
                         const std::string& team1, const std::string& team2) {
  PromptSet set;
  set.opening = OpeningPrompt(team1, team2);
  const std::string hint = LevelHint(level);
  for (const auto& style_template : StyleTemplates(style)) {
    set.prompts.push_back(ComposePrompt(style_template, hint));
  }
  return set;
}

PromptPicker::PromptPicker(std::vector<std::string> prompts, uint32_t seed)
    : prompts_(std::move(prompts)),
      rng_(seed != 0 ? seed : std::random_device{}()) {
  if (prompts_.empty()) {
    throw std::invalid_argument("PromptPicker requires at least one prompt");
  }
}

const std::string& PromptPicker::Pick() {
  std::uniform_int_distribution<size_t> dist(0, prompts_.size() - 1);
  return prompts_[dist(rng_)];
}

}  // namespace gamecast::commentary
