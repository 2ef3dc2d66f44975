#pragma once

#include <pugixml.hpp>

#include <string>

#include "content_extractor.hpp"

namespace lumina_core {

/**
 * @class DocxExtractor
 * @brief Word-processing containers (OOXML).
 *
 * The document body is first rewritten as simple HTML (headings, paragraphs,
 * list items, tables) and then stripped to text, so block boundaries survive
 * as line breaks. Legacy binary .doc files are rejected.
 */
class DocxExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::WordDocument;
  }
  std::string extract(const Bytes& bytes) const override;

  // Intermediate tagged form of a parsed word/document.xml.
  static std::string to_markup(const pugi::xml_document& document);
};

}  // namespace lumina_core
