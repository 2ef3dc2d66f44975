#include "lumina_core/detection/format_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace lumina_core {

namespace {

const std::unordered_map<std::string, FormatTag>& extension_table() {
  static const std::unordered_map<std::string, FormatTag> table = {
      {".pdf", FormatTag::Pdf},
      {".docx", FormatTag::WordDocument},
      {".doc", FormatTag::WordDocument},
      {".pptx", FormatTag::Presentation},
      {".ppt", FormatTag::Presentation},
      {".xlsx", FormatTag::SpreadsheetModern},
      {".xls", FormatTag::SpreadsheetLegacy},
      {".txt", FormatTag::PlainText},
      {".text", FormatTag::PlainText},
      {".md", FormatTag::Markdown},
      {".markdown", FormatTag::Markdown},
      {".html", FormatTag::Html},
      {".htm", FormatTag::Html},
      {".xhtml", FormatTag::Html},
      {".epub", FormatTag::Ebook},
      {".rtf", FormatTag::RichText},
  };
  return table;
}

// The compound-document signature is shared by legacy spreadsheets, word
// processing files and presentations; only the extension can tell them apart.
const std::unordered_map<std::string, FormatTag>& compound_document_tie_break() {
  static const std::unordered_map<std::string, FormatTag> table = {
      {".xls", FormatTag::SpreadsheetLegacy},  {".xlt", FormatTag::SpreadsheetLegacy},
      {".xlsx", FormatTag::SpreadsheetLegacy}, {".doc", FormatTag::WordDocument},
      {".dot", FormatTag::WordDocument},       {".docx", FormatTag::WordDocument},
      {".ppt", FormatTag::Presentation},       {".pps", FormatTag::Presentation},
      {".pot", FormatTag::Presentation},       {".pptx", FormatTag::Presentation},
  };
  return table;
}

constexpr FormatTag COMPOUND_DOCUMENT_DEFAULT = FormatTag::SpreadsheetLegacy;

constexpr std::string_view PDF_MAGIC = "%PDF";
constexpr std::string_view ZIP_MAGIC = "PK\x03\x04";
constexpr std::string_view RTF_MAGIC = "{\\rtf";
constexpr std::array<std::uint8_t, 8> COMPOUND_DOCUMENT_MAGIC = {0xD0, 0xCF, 0x11, 0xE0,
                                                                 0xA1, 0xB1, 0x1A, 0xE1};

bool starts_with(const Bytes& bytes, std::string_view magic) {
  return bytes.size() >= magic.size() &&
         std::equal(magic.begin(), magic.end(), bytes.begin(),
                    [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
}

std::string_view sniff_window(const Bytes& bytes) {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                          std::min(bytes.size(), FormatDetector::SNIFF_WINDOW));
}

}  // namespace

std::string FormatDetector::lowercase_extension(const std::string& declared_name) {
  std::string extension = std::filesystem::path(declared_name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return extension;
}

std::optional<FormatTag> FormatDetector::tag_for_extension(const std::string& declared_name) {
  const auto& table = extension_table();
  auto it = table.find(lowercase_extension(declared_name));
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

FormatTag FormatDetector::detect(const std::string& declared_name, const Bytes& bytes) const {
  const std::string extension = lowercase_extension(declared_name);
  const std::optional<FormatTag> by_extension = tag_for_extension(declared_name);

  if (starts_with(bytes, PDF_MAGIC)) {
    return FormatTag::Pdf;
  }

  if (starts_with(bytes, ZIP_MAGIC)) {
    if (auto inner = sniff_zip_container(bytes)) {
      return *inner;
    }
    // A ZIP whose first entries say nothing: trust the extension if it names a container.
    if (by_extension && (*by_extension == FormatTag::WordDocument ||
                         *by_extension == FormatTag::Presentation ||
                         *by_extension == FormatTag::SpreadsheetModern ||
                         *by_extension == FormatTag::Ebook)) {
      return *by_extension;
    }
    return FormatTag::PlainText;
  }

  if (bytes.size() >= COMPOUND_DOCUMENT_MAGIC.size() &&
      std::equal(COMPOUND_DOCUMENT_MAGIC.begin(), COMPOUND_DOCUMENT_MAGIC.end(), bytes.begin())) {
    return resolve_compound_document(extension, declared_name);
  }

  if (starts_with(bytes, RTF_MAGIC)) {
    return FormatTag::RichText;
  }

  // No binary signature. A binary-format extension on signature-less bytes is a lie.
  if (by_extension && (*by_extension == FormatTag::PlainText ||
                       *by_extension == FormatTag::Markdown || *by_extension == FormatTag::Html)) {
    return *by_extension;
  }

  if (looks_like_html(bytes)) {
    return FormatTag::Html;
  }

  return FormatTag::PlainText;
}

std::optional<FormatTag> FormatDetector::sniff_zip_container(const Bytes& bytes) {
  const std::string_view window = sniff_window(bytes);

  static const std::array<std::pair<std::string_view, FormatTag>, 4> inner_markers = {{
      {"word/", FormatTag::WordDocument},
      {"ppt/", FormatTag::Presentation},
      {"xl/", FormatTag::SpreadsheetModern},
      {"application/epub+zip", FormatTag::Ebook},
  }};

  for (const auto& [marker, tag] : inner_markers) {
    if (window.find(marker) != std::string_view::npos) {
      return tag;
    }
  }
  return std::nullopt;
}

FormatTag FormatDetector::resolve_compound_document(const std::string& extension,
                                                    const std::string& declared_name) {
  const auto& table = compound_document_tie_break();
  auto it = table.find(extension);
  if (it != table.end()) {
    return it->second;
  }
  std::cerr << "[Detector] Warning: compound document '" << declared_name
            << "' has no distinguishing extension; assuming " << to_string(COMPOUND_DOCUMENT_DEFAULT)
            << std::endl;
  return COMPOUND_DOCUMENT_DEFAULT;
}

bool FormatDetector::looks_like_html(const Bytes& bytes) {
  std::string lowered(sniff_window(bytes));
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lowered.find("<html") != std::string::npos ||
         lowered.find("<!doctype html") != std::string::npos;
}

}  // namespace lumina_core
