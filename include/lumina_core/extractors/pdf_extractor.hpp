#pragma once

#include "content_extractor.hpp"

namespace lumina_core {

// Page texts in page order, separated by a blank line.
class PdfExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::Pdf;
  }
  std::string extract(const Bytes& bytes) const override;
};

}  // namespace lumina_core
