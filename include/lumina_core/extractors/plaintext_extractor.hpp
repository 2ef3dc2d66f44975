#pragma once

#include "content_extractor.hpp"

namespace lumina_core {

// Plain text, markdown and anything unrecognised. Never fails on encoding.
class PlainTextExtractor : public ContentExtractor {
 public:
  explicit PlainTextExtractor(FormatTag format = FormatTag::PlainText) : format_(format) {}

  FormatTag get_format() const override {
    return format_;
  }
  std::string extract(const Bytes& bytes) const override;

 private:
  FormatTag format_;
};

}  // namespace lumina_core
