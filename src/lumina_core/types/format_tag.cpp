#include "lumina_core/types/format_tag.hpp"

namespace lumina_core {

std::string to_string(FormatTag tag) {
  switch (tag) {
    case FormatTag::Pdf:
      return "pdf";
    case FormatTag::WordDocument:
      return "docx";
    case FormatTag::Presentation:
      return "pptx";
    case FormatTag::SpreadsheetModern:
      return "xlsx";
    case FormatTag::SpreadsheetLegacy:
      return "xls";
    case FormatTag::PlainText:
      return "txt";
    case FormatTag::Markdown:
      return "markdown";
    case FormatTag::Html:
      return "html";
    case FormatTag::Ebook:
      return "epub";
    case FormatTag::RichText:
      return "rtf";
    case FormatTag::UnknownDefault:
      return "unknown";
  }
  return "unknown";
}

FormatTag format_from_string(const std::string& str) {
  if (str == "pdf")
    return FormatTag::Pdf;
  if (str == "docx")
    return FormatTag::WordDocument;
  if (str == "pptx")
    return FormatTag::Presentation;
  if (str == "xlsx")
    return FormatTag::SpreadsheetModern;
  if (str == "xls")
    return FormatTag::SpreadsheetLegacy;
  if (str == "txt")
    return FormatTag::PlainText;
  if (str == "markdown")
    return FormatTag::Markdown;
  if (str == "html")
    return FormatTag::Html;
  if (str == "epub")
    return FormatTag::Ebook;
  if (str == "rtf")
    return FormatTag::RichText;
  return FormatTag::UnknownDefault;
}

}  // namespace lumina_core
