#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lumina_core/types/artifact.hpp"

namespace lumina_core {

/**
 * @class ResponseParser
 * @brief Recovers a JSON object or array from a free-form backend reply.
 *
 * Tolerates surrounding whitespace, code fences (either one missing) and
 * prose around the payload. Keys and elements keep the order they had in the
 * reply. Content is not validated beyond the outer shape. Throws ParseError
 * when nothing usable is found.
 */
class ResponseParser {
 public:
  static ParsedArtifact parse(const std::string& raw_text, ExpectedShape expected);

  // Per-kind parse: the kind's shape, plus the Mermaid fallback for concept maps.
  static ParsedArtifact parse_for(ArtifactKind kind, const std::string& raw_text);

  // Trimmed reply with a leading and/or trailing code fence removed.
  static std::string strip_fences(std::string_view text);

  // First balanced {...} or [...] region that parses, ignoring brackets inside strings.
  // With an expected shape, regions of another shape are passed over while a later one fits;
  // if none fits, the first region that parsed is returned.
  static std::optional<Json> find_embedded(std::string_view text,
                                           std::optional<ExpectedShape> expected = std::nullopt);
};

}  // namespace lumina_core
