#include "lumina_core/extractors/html_extractor.hpp"

#include "lumina_core/extractors/markup_text.hpp"
#include "lumina_core/extractors/text_decoder.hpp"

namespace lumina_core {

std::string HtmlExtractor::extract(const Bytes& bytes) const {
  std::string html = TextDecoder::decode(bytes).text;
  try {
    return markup_to_text(html);
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

}  // namespace lumina_core
