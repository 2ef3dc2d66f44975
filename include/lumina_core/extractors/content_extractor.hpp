#pragma once

#include <memory>
#include <string>

#include "lumina_core/errors.hpp"
#include "lumina_core/types/document.hpp"
#include "lumina_core/types/format_tag.hpp"

namespace lumina_core {

// One extraction strategy per FormatTag. Structural failures are reported as
// ExtractionError carrying the tag; an extractor never hands off to another one.
class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  virtual FormatTag get_format() const = 0;

  // Raw, unnormalized UTF-8 text.
  virtual std::string extract(const Bytes& bytes) const = 0;

 protected:
  [[noreturn]] void fail(const std::string& cause) const {
    throw ExtractionError(get_format(), cause);
  }
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace lumina_core
