// Repository: Gamecast-commentary
// Component: Prompt Catalog
// Purpose: Opening prompt, style templates and level hints, plus the uniform
//          random picker used by both commentary strategies.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_PROMPT_CATALOG_HPP_
#define GAMECAST_COMMENTARY_PROMPT_CATALOG_HPP_

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "gamecast/commentary/CommentaryTypes.hpp"

namespace gamecast::commentary {

// Opening prompt plus the regular prompts a strategy chooses from.
// Every regular prompt is template(style) followed by hint(level).
struct PromptSet {
  std::string opening;
  std::vector<std::string> prompts;
};

std::string OpeningPrompt(const std::string& team1, const std::string& team2);
std::string LevelHint(KnowledgeLevel level);
std::vector<std::string> StyleTemplates(CommentaryStyle style);

// Joins template and hint with a single space; an empty hint adds nothing.
std::string ComposePrompt(const std::string& style_template, const std::string& hint);

PromptSet BuildPromptSet(CommentaryStyle style, KnowledgeLevel level,
                         const std::string& team1, const std::string& team2);

// Uniform choice over a fixed prompt list. Not thread-safe; each strategy
// owns its picker.
class PromptPicker {
 public:
  // seed 0 draws a seed from std::random_device.
  PromptPicker(std::vector<std::string> prompts, uint32_t seed);

  // Requires a non-empty prompt list.
  const std::string& Pick();

  size_t Size() const { return prompts_.size(); }

 private:
  std::vector<std::string> prompts_;
  std::mt19937 rng_;
};

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_PROMPT_CATALOG_HPP_
