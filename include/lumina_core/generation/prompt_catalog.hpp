#pragma once

#include <string>
#include <string_view>

#include "lumina_core/types/artifact.hpp"

namespace lumina_core {

struct KindProfile {
  ExpectedShape shape;
  size_t text_budget;  // code points of source text sent to the backend
  int max_output_tokens;
  int default_count;  // 0 when the kind takes no count hint
};

struct Prompt {
  std::string system_instruction;
  std::string user_prompt;
  int max_output_tokens;
};

/**
 * @class PromptCatalog
 * @brief Role-specific instruction pairs, one per artifact kind.
 *
 * Each user prompt states the JSON shape the parser will expect, carries the
 * source excerpt cut to the kind's budget and any count or difficulty hints.
 */
class PromptCatalog {
 public:
  static const KindProfile& profile(ArtifactKind kind);

  static Prompt build(const ArtifactRequest& request);

  // Leading code points of text, never splitting a UTF-8 sequence.
  static std::string bound_text(std::string_view text, size_t max_code_points);

  static std::string difficulty_guidance(Difficulty difficulty);
};

}  // namespace lumina_core
