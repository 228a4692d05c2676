// Repository: Gamecast-commentary
// Component: Session Configuration
// Copyright (c) 2025 RetroVue

#include "gamecast/config/SessionConfig.hpp"

#include <algorithm>
#include <cctype>

namespace gamecast::config {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

ConfigValidation Invalid(std::string detail) {
  return ConfigValidation{false, std::move(detail)};
}

}  // namespace

ConfigValidation ValidateSessionConfig(const SessionConfig& config) {
  if (config.team1.empty() || config.team2.empty()) {
    return Invalid("team names must not be empty");
  }

  if (config.strategy == StrategyKind::kPeriodic) {
    const auto& p = config.periodic;
    if (p.startup_delay_ms < 0 || p.settle_delay_ms < 0) {
      return Invalid("periodic startup/settle delays must not be negative");
    }
    if (p.interval_ms <= 0) {
      return Invalid("periodic interval must be positive");
    }
    if (p.fault_backoff_ms <= 0) {
      return Invalid("periodic fault backoff must be positive");
    }
  } else {
    const auto& e = config.event;
    if (e.cooldown_ms < 0) {
      return Invalid("cooldown must not be negative");
    }
    if (e.debounce_ms <= 0) {
      return Invalid("debounce window must be positive");
    }
    if (e.qualifying_label.empty()) {
      return Invalid("qualifying label must not be empty");
    }
    if (e.min_confidence < 0.0 || e.min_confidence > 1.0) {
      return Invalid("min confidence must be within [0, 1]");
    }
  }

  if (!config.feed.source_uri.empty()) {
    if (config.feed.fault_backoff_ms <= 0) {
      return Invalid("feed fault backoff must be positive");
    }
    if (config.feed.packet_yield_ms < 0) {
      return Invalid("feed packet yield must not be negative");
    }
  }

  return ConfigValidation{};
}

std::optional<commentary::KnowledgeLevel> ParseKnowledgeLevel(const std::string& text) {
  const std::string value = Lower(text);
  if (value == "beginner") return commentary::KnowledgeLevel::kBeginner;
  if (value == "intermediate") return commentary::KnowledgeLevel::kIntermediate;
  if (value == "expert") return commentary::KnowledgeLevel::kExpert;
  return std::nullopt;
}

std::optional<commentary::CommentaryStyle> ParseCommentaryStyle(const std::string& text) {
  const std::string value = Lower(text);
  if (value == "enthusiastic") return commentary::CommentaryStyle::kEnthusiastic;
  if (value == "analytical") return commentary::CommentaryStyle::kAnalytical;
  if (value == "casual") return commentary::CommentaryStyle::kCasual;
  if (value == "roasting") return commentary::CommentaryStyle::kRoasting;
  return std::nullopt;
}

std::optional<StrategyKind> ParseStrategyKind(const std::string& text) {
  const std::string value = Lower(text);
  if (value == "periodic") return StrategyKind::kPeriodic;
  if (value == "event" || value == "event-triggered") return StrategyKind::kEventTriggered;
  return std::nullopt;
}

const char* ToString(commentary::KnowledgeLevel level) {
  switch (level) {
    case commentary::KnowledgeLevel::kBeginner: return "beginner";
    case commentary::KnowledgeLevel::kIntermediate: return "intermediate";
    case commentary::KnowledgeLevel::kExpert: return "expert";
  }
  return "unknown";
}

const char* ToString(commentary::CommentaryStyle style) {
  switch (style) {
    case commentary::CommentaryStyle::kEnthusiastic: return "enthusiastic";
    case commentary::CommentaryStyle::kAnalytical: return "analytical";
    case commentary::CommentaryStyle::kCasual: return "casual";
    case commentary::CommentaryStyle::kRoasting: return "roasting";
  }
  return "unknown";
}

const char* ToString(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::kPeriodic: return "periodic";
    case StrategyKind::kEventTriggered: return "event";
  }
  return "unknown";
}

}  // namespace gamecast::config
