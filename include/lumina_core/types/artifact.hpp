#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lumina_core {

// Key order of backend replies is kept exactly as received.
using Json = nlohmann::ordered_json;
using ParsedArtifact = Json;

enum class ArtifactKind { Summary, Notes, Flashcards, Quiz, ConceptMap };

enum class Difficulty { Easy, Medium, Hard, Mixed };

enum class ExpectedShape { Object, Array };

std::string to_string(ArtifactKind kind);
std::optional<ArtifactKind> artifact_kind_from_string(const std::string& str);
std::vector<ArtifactKind> all_artifact_kinds();

std::string to_string(Difficulty difficulty);
std::optional<Difficulty> difficulty_from_string(const std::string& str);

std::string to_string(ExpectedShape shape);

// One request per kind per document. Self-contained so it can be issued from any thread.
struct ArtifactRequest {
  ArtifactKind kind;
  std::string source_text;  // already bounded to the kind's budget
  std::string document_name;
  std::optional<int> count_hint;
  std::optional<Difficulty> difficulty_hint;
  std::chrono::seconds timeout{180};
};

struct ArtifactReply {
  ArtifactKind kind;
  std::string raw_text;
};

}  // namespace lumina_core
