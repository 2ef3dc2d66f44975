#pragma once

#include <cstddef>
#include <string>

namespace lumina_core {

// Canonical document classification. Every extractor is addressed by exactly one tag.
enum class FormatTag {
  Pdf,
  WordDocument,
  Presentation,
  SpreadsheetModern,
  SpreadsheetLegacy,
  PlainText,
  Markdown,
  Html,
  Ebook,
  RichText,
  UnknownDefault
};

inline constexpr std::size_t FORMAT_TAG_COUNT = static_cast<std::size_t>(FormatTag::UnknownDefault) + 1;

// Conversion utilities
std::string to_string(FormatTag tag);
FormatTag format_from_string(const std::string& str);

}  // namespace lumina_core
