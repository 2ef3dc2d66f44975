#include "lumina_core/extractors/text_decoder.hpp"

#include <utf8.h>

#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>

#include "lumina_core/extractors/charset_converter.hpp"

namespace lumina_core {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

std::string_view strip_bom(std::string_view bytes) {
  if (bytes.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
    bytes.remove_prefix(UTF8_BOM.size());
  }
  return bytes;
}

std::optional<std::string> try_charset(const std::string& charset, std::string_view bytes) {
  try {
    CharsetConverter converter(charset);
    return converter.convert(bytes);
  } catch (const std::exception& e) {
    std::cerr << "[TextDecoder] Warning: " << e.what() << std::endl;
    return std::nullopt;
  }
}

}  // namespace

const std::vector<std::string>& TextDecoder::fallback_encodings() {
  // windows-1252 rejects five undefined bytes, so ISO-8859-1 still has work to do after it.
  static const std::vector<std::string> encodings = {"WINDOWS-1252", "ISO-8859-1"};
  return encodings;
}

TextDecoder::Decoded TextDecoder::decode(const Bytes& bytes) {
  return decode(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

TextDecoder::Decoded TextDecoder::decode(std::string_view bytes) {
  std::string_view body = strip_bom(bytes);
  if (utf8::is_valid(body.begin(), body.end())) {
    return {std::string(body), "UTF-8", false};
  }

  for (const auto& encoding : fallback_encodings()) {
    if (auto converted = try_charset(encoding, bytes)) {
      return {std::move(*converted), encoding, false};
    }
  }

  return {decode_lossy(body), "UTF-8", true};
}

std::string TextDecoder::decode_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  auto it = bytes.begin();
  while (it != bytes.end()) {
    auto invalid = utf8::find_invalid(it, bytes.end());
    out.append(it, invalid);
    if (invalid == bytes.end()) {
      break;
    }
    it = std::next(invalid);
  }
  return out;
}

std::string TextDecoder::decode_windows_1252_byte(unsigned char byte) {
  if (byte < 0x80) {
    return std::string(1, static_cast<char>(byte));
  }
  const char raw = static_cast<char>(byte);
  if (auto converted = try_charset("WINDOWS-1252", std::string_view(&raw, 1))) {
    return *converted;
  }
  // The five undefined windows-1252 positions map straight to their code point.
  std::string out;
  utf8::append(static_cast<std::uint32_t>(byte), std::back_inserter(out));
  return out;
}

}  // namespace lumina_core
