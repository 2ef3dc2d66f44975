#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lumina_core/types/format_tag.hpp"

namespace lumina_core {

using Bytes = std::vector<std::uint8_t>;

// Bytes exactly as fetched. Never mutated after construction.
struct RawDocument {
  Bytes bytes;
  std::string declared_name;
  std::string origin;
};

struct ExtractedText {
  std::string raw;
  FormatTag format;
};

// Output of the acquisition step, consumed by generation.
struct AcquiredDocument {
  RawDocument document;
  FormatTag format;
  std::string content_id;
  size_t size;
  std::string text;  // normalized
};

}  // namespace lumina_core
