#pragma once

#include <optional>
#include <string>

#include "lumina_core/types/document.hpp"
#include "lumina_core/types/format_tag.hpp"

namespace lumina_core {

/**
 * @class FormatDetector
 * @brief Classifies fetched bytes plus a candidate filename into one FormatTag.
 *
 * The filename is only a hint. Binary signatures (PDF, ZIP containers, compound
 * documents, RTF) override whatever the extension claims; the extension decides
 * between text-like formats that carry no signature. Anything unrecognised is
 * plain text, so detect() never fails.
 */
class FormatDetector {
 public:
  // Number of leading bytes inspected for inner ZIP paths and HTML markers.
  static constexpr size_t SNIFF_WINDOW = 1000;

  FormatTag detect(const std::string& declared_name, const Bytes& bytes) const;

  // Case-insensitive suffix lookup. Empty for unknown or missing extensions.
  static std::optional<FormatTag> tag_for_extension(const std::string& declared_name);

 private:
  static std::string lowercase_extension(const std::string& declared_name);
  static std::optional<FormatTag> sniff_zip_container(const Bytes& bytes);
  static FormatTag resolve_compound_document(const std::string& extension,
                                             const std::string& declared_name);
  static bool looks_like_html(const Bytes& bytes);
};

}  // namespace lumina_core
