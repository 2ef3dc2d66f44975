#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lumina_core/llm/ollama_client.hpp"
#include "lumina_core/types/artifact.hpp"

namespace lumina_core {

struct GenerationOptions {
  std::vector<ArtifactKind> kinds;
  std::optional<int> flashcard_count;
  std::optional<int> quiz_question_count;
  std::optional<Difficulty> difficulty;
  std::chrono::seconds timeout{180};
  bool parallel{true};
};

// Result of one kind's request/reply/parse cycle: the artifact or the reason it is missing.
struct KindOutcome {
  ArtifactKind kind;
  std::optional<ParsedArtifact> artifact;
  std::string error;

  bool ok() const {
    return artifact.has_value();
  }
};

struct GenerationResult {
  // In request order, one entry per distinct requested kind.
  std::vector<KindOutcome> outcomes;

  std::vector<ArtifactKind> generated_kinds() const;
  const ParsedArtifact* artifact(ArtifactKind kind) const;
};

/**
 * @class GenerationService
 * @brief Drives the backend once per requested artifact kind.
 *
 * Each kind is an independent unit: its request is built from the normalized
 * text, sent with its own timeout and parsed on its own. A backend or parse
 * failure becomes that kind's error and never affects the other kinds. Units
 * may run concurrently; they share nothing but the thread-safe client.
 */
class GenerationService {
 public:
  explicit GenerationService(std::shared_ptr<OllamaClient> ollama_client);
  virtual ~GenerationService() = default;

  virtual GenerationResult generate(const std::string& normalized_text,
                                    const std::string& document_name,
                                    const GenerationOptions& options) const;

  static ArtifactRequest make_request(ArtifactKind kind,
                                      const std::string& normalized_text,
                                      const std::string& document_name,
                                      const GenerationOptions& options);

  // Never throws for backend or parse failures; they are reported in the outcome.
  KindOutcome run_unit(const ArtifactRequest& request) const;

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
};

}  // namespace lumina_core
