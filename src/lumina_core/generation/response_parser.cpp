#include "lumina_core/generation/response_parser.hpp"

#include <cctype>

#include "lumina_core/errors.hpp"
#include "lumina_core/generation/prompt_catalog.hpp"

namespace lumina_core {

namespace {

constexpr std::string_view FENCE = "```";
constexpr std::string_view MERMAID_MINDMAP = "mindmap";

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::optional<Json> try_parse(std::string_view text) {
  Json value = Json::parse(text.begin(), text.end(), nullptr, false);
  if (value.is_discarded()) {
    return std::nullopt;
  }
  return value;
}

// End index (inclusive) of the bracket region opened at start, or npos if it never closes.
size_t matching_close(std::string_view text, size_t start) {
  std::string stack;
  bool in_string = false;
  bool escaped = false;
  for (size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{' || c == '[') {
      stack.push_back(c == '{' ? '}' : ']');
    } else if (c == '}' || c == ']') {
      if (stack.empty() || stack.back() != c) {
        return std::string_view::npos;
      }
      stack.pop_back();
      if (stack.empty()) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

bool is_tag_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '+' || c == '.';
}

// {"flashcards": [...]} style wrapper around the expected array, or nullptr.
const Json* single_array_member(const Json& value) {
  if (!value.is_object() || value.size() != 1 || !value.begin()->is_array()) {
    return nullptr;
  }
  return &*value.begin();
}

bool fits(const Json& value, ExpectedShape expected) {
  if (expected == ExpectedShape::Object) {
    return value.is_object();
  }
  return value.is_array() || single_array_member(value) != nullptr;
}

ParsedArtifact coerce(Json value, ExpectedShape expected, const std::string& raw_text) {
  if (expected == ExpectedShape::Object) {
    if (value.is_object()) {
      return value;
    }
    throw ParseError("expected an object, got " + std::string(value.type_name()), raw_text);
  }

  if (value.is_array()) {
    return value;
  }
  if (const Json* only_array = single_array_member(value)) {
    return *only_array;
  }
  throw ParseError("expected an array, got " + std::string(value.type_name()), raw_text);
}

}  // namespace

std::string ResponseParser::strip_fences(std::string_view text) {
  text = trim(text);
  if (text.substr(0, FENCE.size()) == FENCE) {
    // Opening fence and an optional language tag; the payload may follow on the same line.
    text.remove_prefix(FENCE.size());
    size_t tag_end = 0;
    while (tag_end < text.size() && is_tag_char(text[tag_end])) {
      ++tag_end;
    }
    text.remove_prefix(tag_end);
  }
  text = trim(text);
  if (text.size() >= FENCE.size() && text.substr(text.size() - FENCE.size()) == FENCE) {
    text.remove_suffix(FENCE.size());
  }
  return std::string(trim(text));
}

std::optional<Json> ResponseParser::find_embedded(std::string_view text, std::optional<ExpectedShape> expected) {
  std::optional<Json> first_found;
  for (size_t start = text.find_first_of("{["); start != std::string_view::npos;
       start = text.find_first_of("{[", start + 1)) {
    const size_t end = matching_close(text, start);
    if (end == std::string_view::npos) {
      continue;
    }
    auto value = try_parse(text.substr(start, end - start + 1));
    if (!value) {
      continue;
    }
    if (!expected || fits(*value, *expected)) {
      return value;
    }
    if (!first_found) {
      first_found = std::move(value);
    }
    // Regions nested inside a parsed one are never candidates on their own.
    start = end;
  }

  if (first_found) {
    return first_found;
  }

  // Last resort: everything from the first opening to the last closing bracket.
  const size_t first = text.find_first_of("{[");
  const size_t last = text.find_last_of("}]");
  if (first != std::string_view::npos && last != std::string_view::npos && last > first) {
    auto value = try_parse(text.substr(first, last - first + 1));
    if (value && value->is_structured()) {
      return value;
    }
  }
  return std::nullopt;
}

ParsedArtifact ResponseParser::parse(const std::string& raw_text, ExpectedShape expected) {
  const std::string body = strip_fences(raw_text);

  std::optional<Json> value = try_parse(body);
  if (!value || !value->is_structured()) {
    value = find_embedded(body, expected);
  }
  if (!value) {
    throw ParseError("no JSON " + to_string(expected) + " found", raw_text);
  }
  return coerce(std::move(*value), expected, raw_text);
}

ParsedArtifact ResponseParser::parse_for(ArtifactKind kind, const std::string& raw_text) {
  const ExpectedShape expected = PromptCatalog::profile(kind).shape;
  if (kind != ArtifactKind::ConceptMap) {
    return parse(raw_text, expected);
  }

  try {
    return parse(raw_text, expected);
  } catch (const ParseError&) {
    const std::string body = strip_fences(raw_text);
    if (body.rfind(MERMAID_MINDMAP, 0) != 0) {
      throw;
    }
    Json mermaid = Json::object();
    mermaid["format"] = "mermaid";
    mermaid["source"] = body;
    return mermaid;
  }
}

}  // namespace lumina_core
