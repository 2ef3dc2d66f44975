#pragma once

#include <string>
#include <vector>

#include "content_extractor.hpp"
#include "zip_archive.hpp"

namespace lumina_core {

// Slide decks. Each slide is introduced by a "--- Slide N ---" marker line.
class PptxExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::Presentation;
  }
  std::string extract(const Bytes& bytes) const override;

  // Slide parts in presentation order.
  static std::vector<std::string> slide_parts(const ZipArchive& archive);
};

}  // namespace lumina_core
