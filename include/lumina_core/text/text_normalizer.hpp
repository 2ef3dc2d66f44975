#pragma once

#include <string>
#include <string_view>

namespace lumina_core {

/**
 * @class TextNormalizer
 * @brief Canonical whitespace for extracted text.
 *
 * The result has no run of three or more newlines, no repeated horizontal
 * whitespace, no interior lines holding only a page number, only "\n" line
 * terminators and no surrounding whitespace. normalize() is idempotent.
 */
class TextNormalizer {
 public:
  static std::string normalize(std::string_view raw);

  // Individual steps, in the order normalize() applies them.
  static std::string collapse_blank_runs(std::string_view text);
  static std::string collapse_horizontal_space(std::string_view text);
  static std::string drop_page_numbers(std::string_view text);
  static std::string unify_line_endings(std::string_view text);
  static std::string trim(std::string_view text);
};

}  // namespace lumina_core
