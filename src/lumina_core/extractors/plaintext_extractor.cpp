#include "lumina_core/extractors/plaintext_extractor.hpp"

#include <iostream>

#include "lumina_core/extractors/text_decoder.hpp"

namespace lumina_core {

std::string PlainTextExtractor::extract(const Bytes& bytes) const {
  TextDecoder::Decoded decoded = TextDecoder::decode(bytes);
  if (decoded.lossy) {
    std::cerr << "[Extractor] Warning: " << to_string(format_)
              << " input is not valid in any known encoding; invalid bytes dropped" << std::endl;
  }
  return std::move(decoded.text);
}

}  // namespace lumina_core
