#pragma once

#include <iconv.h>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lumina_core {

/**
 * @class CharsetConverter
 * @brief RAII wrapper around an iconv descriptor converting one charset to UTF-8.
 *
 * A converter is not thread-safe; create one per conversion site or thread.
 */
class CharsetConverter {
 public:
  explicit CharsetConverter(const std::string& from_charset);
  ~CharsetConverter();

  // Strict conversion. Returns nullopt on the first invalid or incomplete sequence.
  std::optional<std::string> convert(std::string_view input) const;

  const std::string& charset() const {
    return from_charset_;
  }

  CharsetConverter(const CharsetConverter&) = delete;
  CharsetConverter& operator=(const CharsetConverter&) = delete;
  CharsetConverter(CharsetConverter&&) = delete;
  CharsetConverter& operator=(CharsetConverter&&) = delete;

 private:
  // glibc's iconv_open races on its gconv module cache.
  static std::mutex iconv_open_mutex_;

  std::string from_charset_;
  iconv_t descriptor_;
};

}  // namespace lumina_core
