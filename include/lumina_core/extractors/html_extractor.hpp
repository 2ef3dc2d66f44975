#pragma once

#include "content_extractor.hpp"

namespace lumina_core {

class HtmlExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::Html;
  }
  std::string extract(const Bytes& bytes) const override;
};

}  // namespace lumina_core
