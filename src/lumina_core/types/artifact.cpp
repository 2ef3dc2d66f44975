#include "lumina_core/types/artifact.hpp"

namespace lumina_core {

std::string to_string(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::Summary:
      return "summary";
    case ArtifactKind::Notes:
      return "cornellNotes";
    case ArtifactKind::Flashcards:
      return "flashcards";
    case ArtifactKind::Quiz:
      return "quiz";
    case ArtifactKind::ConceptMap:
      return "mindMap";
  }
  return "unknown";
}

std::optional<ArtifactKind> artifact_kind_from_string(const std::string& str) {
  if (str == "summary")
    return ArtifactKind::Summary;
  if (str == "cornellNotes" || str == "notes")
    return ArtifactKind::Notes;
  if (str == "flashcards")
    return ArtifactKind::Flashcards;
  if (str == "quiz")
    return ArtifactKind::Quiz;
  if (str == "mindMap" || str == "conceptMap")
    return ArtifactKind::ConceptMap;
  return std::nullopt;
}

std::vector<ArtifactKind> all_artifact_kinds() {
  return {ArtifactKind::Summary, ArtifactKind::Notes, ArtifactKind::Flashcards,
          ArtifactKind::Quiz, ArtifactKind::ConceptMap};
}

std::string to_string(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:
      return "easy";
    case Difficulty::Medium:
      return "medium";
    case Difficulty::Hard:
      return "hard";
    case Difficulty::Mixed:
      return "mixed";
  }
  return "mixed";
}

std::optional<Difficulty> difficulty_from_string(const std::string& str) {
  if (str == "easy")
    return Difficulty::Easy;
  if (str == "medium")
    return Difficulty::Medium;
  if (str == "hard")
    return Difficulty::Hard;
  if (str == "mixed")
    return Difficulty::Mixed;
  return std::nullopt;
}

std::string to_string(ExpectedShape shape) {
  return shape == ExpectedShape::Object ? "object" : "array";
}

}  // namespace lumina_core
