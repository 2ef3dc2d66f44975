#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lumina_core/types/document.hpp"

namespace lumina_core {

/**
 * @class TextDecoder
 * @brief Turns raw bytes of unknown encoding into UTF-8 without ever failing.
 *
 * Candidate encodings are tried in a fixed order and the first one that
 * decodes cleanly wins. If none does, the bytes are decoded as UTF-8 with
 * invalid sequences dropped.
 */
class TextDecoder {
 public:
  struct Decoded {
    std::string text;
    std::string encoding;
    bool lossy;
  };

  // Tried after UTF-8, in order.
  static const std::vector<std::string>& fallback_encodings();

  static Decoded decode(std::string_view bytes);
  static Decoded decode(const Bytes& bytes);

  // UTF-8 decode that discards every invalid byte sequence.
  static std::string decode_lossy(std::string_view bytes);

  // Single byte from a windows-1252 escape (as used by RTF \'hh) to UTF-8.
  static std::string decode_windows_1252_byte(unsigned char byte);
};

}  // namespace lumina_core
