#include "lumina_core/text/text_normalizer.hpp"

#include <vector>

namespace lumina_core {

namespace {

bool is_horizontal(char c) {
  return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

bool is_space(char c) {
  return is_horizontal(c) || c == '\r' || c == '\n';
}

// A lone "\r" or the "\n" of any terminator ends a line; the "\r" of "\r\n" does not.
bool ends_line(std::string_view text, size_t i) {
  return text[i] == '\n' || (text[i] == '\r' && (i + 1 == text.size() || text[i + 1] != '\n'));
}

}  // namespace

std::string TextNormalizer::normalize(std::string_view raw) {
  std::string text = collapse_blank_runs(raw);
  text = collapse_horizontal_space(text);
  text = drop_page_numbers(text);
  text = unify_line_endings(text);
  // Converted "\r" terminators and removed page lines can leave new blank runs.
  text = collapse_blank_runs(text);
  return trim(text);
}

std::string TextNormalizer::collapse_blank_runs(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (!is_space(text[i])) {
      out += text[i++];
      continue;
    }

    size_t end = i;
    size_t first_break = std::string_view::npos;
    size_t last_break = std::string_view::npos;
    size_t breaks = 0;
    while (end < text.size() && is_space(text[end])) {
      if (ends_line(text, end)) {
        if (first_break == std::string_view::npos) {
          first_break = end;
        }
        last_break = end;
        ++breaks;
      }
      ++end;
    }

    if (breaks < 2) {
      out.append(text.substr(i, end - i));
    } else {
      // Only the span between the first and last break is replaced.
      size_t lead = first_break;
      if (lead > i && text[lead] == '\n' && text[lead - 1] == '\r') {
        --lead;
      }
      out.append(text.substr(i, lead - i));
      out += "\n\n";
      out.append(text.substr(last_break + 1, end - last_break - 1));
    }
    i = end;
  }
  return out;
}

std::string TextNormalizer::collapse_horizontal_space(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (!is_horizontal(text[i])) {
      out += text[i];
      continue;
    }
    out += ' ';
    while (i + 1 < text.size() && is_horizontal(text[i + 1])) {
      ++i;
    }
  }
  return out;
}

// Interior lines that are a bare integer are pagination residue. The first and
// last line are kept because nothing marks them as page breaks.
std::string TextNormalizer::drop_page_numbers(std::string_view text) {
  std::vector<std::string_view> lines;
  std::vector<std::string_view> terminators;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (ends_line(text, i)) {
      size_t content_end = (text[i] == '\n' && i > start && text[i - 1] == '\r') ? i - 1 : i;
      lines.push_back(text.substr(start, content_end - start));
      terminators.push_back(text.substr(content_end, i + 1 - content_end));
      start = i + 1;
    }
  }
  lines.push_back(text.substr(start));
  terminators.emplace_back();

  auto is_page_number = [](std::string_view line) {
    size_t first = 0;
    while (first < line.size() && is_horizontal(line[first])) {
      ++first;
    }
    size_t last = line.size();
    while (last > first && is_horizontal(line[last - 1])) {
      --last;
    }
    if (first == last) {
      return false;
    }
    for (size_t i = first; i < last; ++i) {
      if (line[i] < '0' || line[i] > '9') {
        return false;
      }
    }
    return true;
  };

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    const bool interior = i > 0 && i + 1 < lines.size();
    if (interior && is_page_number(lines[i])) {
      continue;
    }
    out.append(lines[i]);
    out.append(terminators[i]);
  }
  return out;
}

std::string TextNormalizer::unify_line_endings(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out += '\n';
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      out += text[i];
    }
  }
  return out;
}

std::string TextNormalizer::trim(std::string_view text) {
  size_t first = 0;
  while (first < text.size() && is_space(text[first])) {
    ++first;
  }
  size_t last = text.size();
  while (last > first && is_space(text[last - 1])) {
    --last;
  }
  return std::string(text.substr(first, last - first));
}

}  // namespace lumina_core
