#include "lumina_core/extractors/charset_converter.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace lumina_core {

std::mutex CharsetConverter::iconv_open_mutex_;

CharsetConverter::CharsetConverter(const std::string& from_charset)
    : from_charset_(from_charset) {
  std::lock_guard<std::mutex> lock(iconv_open_mutex_);
  descriptor_ = iconv_open("UTF-8", from_charset_.c_str());
  if (descriptor_ == reinterpret_cast<iconv_t>(-1)) {
    throw std::runtime_error("iconv_open() failed for " + from_charset_ + ": " +
                             std::strerror(errno));
  }
}

CharsetConverter::~CharsetConverter() {
  if (descriptor_ != reinterpret_cast<iconv_t>(-1)) {
    iconv_close(descriptor_);
  }
}

std::optional<std::string> CharsetConverter::convert(std::string_view input) const {
  if (input.empty()) {
    return std::string();
  }
  // Reset shift state left over from a previous call.
  iconv(descriptor_, nullptr, nullptr, nullptr, nullptr);

  // iconv is not const-correct for the input buffer.
  char* in_ptr = const_cast<char*>(input.data());
  size_t in_left = input.size();

  std::string output;
  std::vector<char> buffer(input.size() * 4 + 16);

  while (in_left > 0) {
    char* out_ptr = buffer.data();
    size_t out_left = buffer.size();
    size_t result = iconv(descriptor_, &in_ptr, &in_left, &out_ptr, &out_left);
    output.append(buffer.data(), buffer.size() - out_left);
    if (result == static_cast<size_t>(-1)) {
      if (errno == E2BIG) {
        continue;
      }
      // EILSEQ or EINVAL: the input is not valid in this charset.
      return std::nullopt;
    }
  }
  return output;
}

}  // namespace lumina_core
