#pragma once

#include "content_extractor.hpp"

namespace lumina_core {

// Modern spreadsheets. Cached cell values only; formulas are never evaluated.
class XlsxExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::SpreadsheetModern;
  }
  std::string extract(const Bytes& bytes) const override;
};

}  // namespace lumina_core
