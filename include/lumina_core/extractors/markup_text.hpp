#pragma once

#include <string>

namespace lumina_core {

/**
 * Converts UTF-8 HTML or XHTML to visible text.
 *
 * script and style subtrees are dropped. Block-level elements and <br> become
 * line breaks so paragraphs, headings, list items and table rows stay on their
 * own lines. Whitespace is left for the normalizer.
 */
std::string markup_to_text(const std::string& html);

// Escapes text for embedding in the intermediate markup built by container extractors.
std::string escape_markup(const std::string& text);

}  // namespace lumina_core
