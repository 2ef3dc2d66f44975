#include "lumina_core/extractors/rtf_extractor.hpp"

#include <utf8.h>

#include <cctype>
#include <cstdint>
#include <iterator>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "lumina_core/extractors/text_decoder.hpp"

namespace lumina_core {

namespace {

struct GroupState {
  bool skip = false;
  int unicode_skip = 1;  // \ucN: fallback characters following each \u
};

const std::unordered_set<std::string>& skipped_destinations() {
  static const std::unordered_set<std::string> destinations = {
      "fonttbl",  "colortbl", "stylesheet",   "info",        "pict",           "object",
      "header",   "headerl",  "headerr",      "headerf",     "footer",         "footerl",
      "footerr",  "footerf",  "listtable",    "listoverridetable",             "rsidtbl",
      "generator", "themedata", "colorschememapping",       "datastore",      "latentstyles",
      "filetbl",  "revtbl",   "xmlnstbl",     "pgdsctbl",    "mmathPr",        "fldinst",
  };
  return destinations;
}

const std::unordered_map<std::string, std::string>& word_replacements() {
  static const std::unordered_map<std::string, std::string> replacements = {
      {"par", "\n"},         {"line", "\n"},         {"sect", "\n\n"},       {"page", "\n\n"},
      {"row", "\n"},         {"cell", "\t"},         {"tab", "\t"},          {"emdash", "—"},
      {"endash", "–"},  {"bullet", "•"},   {"lquote", "‘"},   {"rquote", "’"},
      {"ldblquote", "“"}, {"rdblquote", "”"}, {"emspace", " "},    {"enspace", " "},
  };
  return replacements;
}

// Parameters are 16-bit in practice; larger values only need to stay out of range.
constexpr long MAX_PARAM = 1000000;

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string RtfExtractor::extract(const Bytes& bytes) const {
  std::string rtf = TextDecoder::decode(bytes).text;
  if (rtf.find("{\\rtf") == std::string::npos) {
    fail("missing {\\rtf header");
  }
  return strip_rtf(rtf);
}

std::string RtfExtractor::strip_rtf(const std::string& rtf) {
  std::string out;
  out.reserve(rtf.size() / 2);

  std::vector<GroupState> stack;
  GroupState state;
  int pending_fallback = 0;
  std::uint32_t high_surrogate = 0;

  auto emit = [&](const std::string& text) {
    if (state.skip) {
      return;
    }
    if (pending_fallback > 0) {
      --pending_fallback;
      return;
    }
    out += text;
  };

  size_t i = 0;
  const size_t n = rtf.size();
  while (i < n) {
    const char c = rtf[i];

    if (c == '{') {
      stack.push_back(state);
      pending_fallback = 0;
      ++i;
      continue;
    }
    if (c == '}') {
      if (!stack.empty()) {
        state = stack.back();
        stack.pop_back();
      }
      pending_fallback = 0;
      ++i;
      continue;
    }
    if (c == '\r' || c == '\n') {
      ++i;
      continue;
    }
    if (c != '\\') {
      emit(std::string(1, c));
      ++i;
      continue;
    }

    // Control symbol or control word.
    if (i + 1 >= n) {
      break;
    }
    const char next = rtf[i + 1];

    if (next == '\\' || next == '{' || next == '}') {
      emit(std::string(1, next));
      i += 2;
      continue;
    }
    if (next == '\'') {
      int high = i + 2 < n ? hex_value(rtf[i + 2]) : -1;
      int low = i + 3 < n ? hex_value(rtf[i + 3]) : -1;
      if (high >= 0 && low >= 0) {
        emit(TextDecoder::decode_windows_1252_byte(static_cast<unsigned char>(high * 16 + low)));
        i += 4;
      } else {
        i += 2;
      }
      continue;
    }
    if (next == '*') {
      state.skip = true;
      i += 2;
      continue;
    }
    if (next == '~') {
      emit(" ");
      i += 2;
      continue;
    }
    if (next == '_') {
      emit("-");
      i += 2;
      continue;
    }
    if (next == '\r' || next == '\n') {
      emit("\n");
      i += 2;
      continue;
    }
    if (!std::isalpha(static_cast<unsigned char>(next))) {
      i += 2;
      continue;
    }

    size_t word_start = i + 1;
    size_t j = word_start;
    while (j < n && std::isalpha(static_cast<unsigned char>(rtf[j]))) {
      ++j;
    }
    std::string word = rtf.substr(word_start, j - word_start);

    bool has_param = false;
    long param = 0;
    bool negative = false;
    if (j < n && rtf[j] == '-') {
      negative = true;
      ++j;
    }
    // Digits past the parameter range are consumed but no longer accumulated.
    while (j < n && std::isdigit(static_cast<unsigned char>(rtf[j]))) {
      has_param = true;
      if (param <= MAX_PARAM) {
        param = param * 10 + (rtf[j] - '0');
      }
      ++j;
    }
    if (negative) {
      param = -param;
    }
    if (j < n && rtf[j] == ' ') {
      ++j;
    }
    i = j;

    if (word == "u" && has_param) {
      if (param < 0) {
        param += 65536;
      }
      std::uint32_t code_point = 0xFFFD;
      if (param < 0 || param > 0xFFFF) {
        high_surrogate = 0;
        if (!state.skip) {
          utf8::append(code_point, std::back_inserter(out));
        }
        pending_fallback = state.skip ? 0 : state.unicode_skip;
        continue;
      }
      auto unit = static_cast<std::uint32_t>(param);
      if (unit >= 0xD800 && unit <= 0xDBFF) {
        high_surrogate = unit;
        code_point = 0;
      } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
        if (high_surrogate != 0) {
          code_point = 0x10000 + ((high_surrogate - 0xD800) << 10) + (unit - 0xDC00);
        }
        high_surrogate = 0;
      } else {
        code_point = unit;
        high_surrogate = 0;
      }
      if (code_point != 0 && !state.skip) {
        utf8::append(code_point, std::back_inserter(out));
      }
      pending_fallback = state.skip ? 0 : state.unicode_skip;
      continue;
    }
    if (word == "uc" && has_param) {
      state.unicode_skip = param < 0 ? 0 : static_cast<int>(param);
      continue;
    }
    if (skipped_destinations().count(word)) {
      state.skip = true;
      continue;
    }
    auto replacement = word_replacements().find(word);
    if (replacement != word_replacements().end()) {
      emit(replacement->second);
    }
  }

  return out;
}

}  // namespace lumina_core
