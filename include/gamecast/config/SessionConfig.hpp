// Repository: Gamecast-commentary
// Component: Session Configuration
// Purpose: Per-session settings supplied by the hosting framework, with the
//          defaults of the football commentator.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_CONFIG_SESSION_CONFIG_HPP_
#define GAMECAST_CONFIG_SESSION_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "gamecast/commentary/CommentaryTypes.hpp"

namespace gamecast::config {

// Which commentary trigger policy a session runs.
enum class StrategyKind {
  kPeriodic,        // Fixed cadence, own thread
  kEventTriggered,  // Driven by detection events
};

struct PeriodicTimings {
  int64_t startup_delay_ms = 3000;   // Before the opening prompt
  int64_t settle_delay_ms = 5000;    // Between opening and first regular prompt
  int64_t interval_ms = 4000;        // Between regular prompts
  int64_t fault_backoff_ms = 2000;   // After a prompt delivery fault
};

struct EventTriggerSettings {
  int64_t cooldown_ms = 10000;       // Quiet period after the opening
  int64_t debounce_ms = 5000;        // Minimum gap between regular prompts
  std::string qualifying_label = "sports ball";
  double min_confidence = 0.5;
};

struct FeedSettings {
  std::string source_uri;            // Empty: no audio feed for this session
  int64_t fault_backoff_ms = 1000;
  int64_t packet_yield_ms = 1;
  bool pace_realtime = true;
};

struct SessionConfig {
  std::string team1 = "Green Bay Packers";
  std::string team2 = "Chicago Bears";
  std::string team1_color = "yellow";
  std::string team2_color = "navy blue with orange";
  std::string favorite_team;         // Empty: not specified

  commentary::KnowledgeLevel level = commentary::KnowledgeLevel::kBeginner;
  commentary::CommentaryStyle style = commentary::CommentaryStyle::kEnthusiastic;
  StrategyKind strategy = StrategyKind::kPeriodic;

  PeriodicTimings periodic;
  EventTriggerSettings event;
  FeedSettings feed;

  // Seed for prompt selection; 0 draws one from std::random_device.
  uint32_t prompt_seed = 0;
};

// ConfigValidation carries the first problem found, if any.
struct ConfigValidation {
  bool valid = true;
  std::string detail;
};

ConfigValidation ValidateSessionConfig(const SessionConfig& config);

// String forms match the hosting framework's option values
// ("beginner", "roasting", "periodic", ...). Parsing is case-insensitive.
std::optional<commentary::KnowledgeLevel> ParseKnowledgeLevel(const std::string& text);
std::optional<commentary::CommentaryStyle> ParseCommentaryStyle(const std::string& text);
std::optional<StrategyKind> ParseStrategyKind(const std::string& text);

const char* ToString(commentary::KnowledgeLevel level);
const char* ToString(commentary::CommentaryStyle style);
const char* ToString(StrategyKind kind);

}  // namespace gamecast::config

#endif  // GAMECAST_CONFIG_SESSION_CONFIG_HPP_
