#pragma once

#include <string>

#include "content_extractor.hpp"

namespace lumina_core {

class RtfExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::RichText;
  }
  std::string extract(const Bytes& bytes) const override;

  // Removes control words, control symbols and non-text destinations.
  static std::string strip_rtf(const std::string& rtf);
};

}  // namespace lumina_core
