// Repository: Gamecast-commentary
// Component: Commentary Types
// Purpose: Detection events, commentary style and knowledge level.
// Copyright (c) 2025 RetroVue

#ifndef GAMECAST_COMMENTARY_COMMENTARY_TYPES_HPP_
#define GAMECAST_COMMENTARY_COMMENTARY_TYPES_HPP_

#include <functional>
#include <string>
#include <vector>

namespace gamecast::commentary {

enum class KnowledgeLevel {
  kBeginner,
  kIntermediate,
  kExpert,
};

// Roasting is one prompt category; the other three styles share the neutral
// category and differ only through the session instructions.
enum class CommentaryStyle {
  kEnthusiastic,
  kAnalytical,
  kCasual,
  kRoasting,
};

inline bool IsRoasting(CommentaryStyle style) {
  return style == CommentaryStyle::kRoasting;
}

struct DetectedObject {
  std::string label;
  double confidence = 0.0;
};

// One detection pass over a video frame. Ephemeral.
struct DetectionEvent {
  std::vector<DetectedObject> objects;
};

// Decides whether a detection event may trigger regular commentary.
using QualifyingPredicate = std::function<bool(const DetectionEvent&)>;

// True when any object carries `label` with confidence >= min_confidence.
inline QualifyingPredicate MakeLabelPredicate(std::string label, double min_confidence) {
  return [label = std::move(label), min_confidence](const DetectionEvent& event) {
    for (const auto& object : event.objects) {
      if (object.label == label && object.confidence >= min_confidence) {
        return true;
      }
    }
    return false;
  };
}

}  // namespace gamecast::commentary

#endif  // GAMECAST_COMMENTARY_COMMENTARY_TYPES_HPP_
