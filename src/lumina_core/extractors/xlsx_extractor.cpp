#include "lumina_core/extractors/xlsx_extractor.hpp"

#include <pugixml.hpp>

#include <string>
#include <vector>

#include "lumina_core/extractors/sheet_text.hpp"
#include "lumina_core/extractors/xml_parts.hpp"
#include "lumina_core/extractors/zip_archive.hpp"

namespace lumina_core {

namespace {

constexpr std::string_view SHARED_STRINGS_TYPE = "/sharedStrings";

// Text of a shared or inline string item, phonetic runs excluded.
std::string string_item_text(const pugi::xml_node& item) {
  std::string text;
  for (pugi::xml_node child = item.first_child(); child; child = child.next_sibling()) {
    std::string_view name = xml_parts::local_name(child);
    if (name == "t") {
      text += child.text().get();
    } else if (name == "r") {
      text += xml_parts::joined_text(child, "t");
    }
  }
  return text;
}

std::vector<std::string> load_shared_strings(const ZipArchive& archive,
                                             const std::string& workbook) {
  std::string part = xml_parts::related_part(archive, workbook, SHARED_STRINGS_TYPE);
  if (part.empty() || !archive.contains(part)) {
    part = "xl/sharedStrings.xml";
  }

  std::vector<std::string> strings;
  if (!archive.contains(part)) {
    return strings;
  }
  pugi::xml_document doc;
  xml_parts::load_part(archive, part, doc);
  xml_parts::for_each_element(doc, "si", [&strings](const pugi::xml_node& item) {
    strings.push_back(string_item_text(item));
  });
  return strings;
}

std::string cell_value(const pugi::xml_node& cell, const std::vector<std::string>& shared) {
  const std::string type = cell.attribute("t").value();
  const std::string raw = xml_parts::first_element(cell, "v").text().get();

  if (type == "s") {
    if (raw.empty()) {
      return "";
    }
    size_t index = std::stoul(raw);
    return index < shared.size() ? shared[index] : "";
  }
  if (type == "inlineStr") {
    pugi::xml_node item = xml_parts::first_element(cell, "is");
    return item ? string_item_text(item) : "";
  }
  if (type == "b") {
    return raw == "1" ? "TRUE" : "FALSE";
  }
  if (type == "str" || type == "e" || raw.empty()) {
    return raw;
  }
  try {
    return format_number(std::stod(raw));
  } catch (const std::exception&) {
    return raw;
  }
}

SheetCells read_sheet(const ZipArchive& archive,
                      const std::string& part,
                      const std::string& name,
                      const std::vector<std::string>& shared) {
  SheetCells sheet{.name = name, .rows = {}};
  pugi::xml_document doc;
  xml_parts::load_part(archive, part, doc);

  size_t next_row = 0;
  xml_parts::for_each_element(doc, "row", [&](const pugi::xml_node& row) {
    std::string row_ref = row.attribute("r").value();
    size_t row_index = row_ref.empty() ? next_row : std::stoul(row_ref) - 1;
    next_row = row_index + 1;

    size_t next_column = 0;
    for (pugi::xml_node cell = row.first_child(); cell; cell = cell.next_sibling()) {
      if (xml_parts::local_name(cell) != "c") {
        continue;
      }
      size_t column = column_from_reference(cell.attribute("r").value());
      if (column == std::string::npos) {
        column = next_column;
      }
      next_column = column + 1;
      std::string value = cell_value(cell, shared);
      if (!value.empty()) {
        sheet.set(row_index, column, std::move(value));
      }
    }
  });
  return sheet;
}

}  // namespace

std::string XlsxExtractor::extract(const Bytes& bytes) const {
  try {
    ZipArchive archive(bytes);
    const std::string workbook = xml_parts::main_part(archive, "xl/workbook.xml");
    pugi::xml_document doc;
    xml_parts::load_part(archive, workbook, doc);

    auto relationships = xml_parts::load_relationships(archive, workbook);
    std::vector<std::string> shared = load_shared_strings(archive, workbook);

    std::vector<SheetCells> sheets;
    size_t position = 0;
    xml_parts::for_each_element(doc, "sheet", [&](const pugi::xml_node& entry) {
      ++position;
      std::string part;
      auto target = relationships.find(xml_parts::attribute(entry, "id", true));
      if (target != relationships.end()) {
        part = target->second;
      } else {
        part = "xl/worksheets/sheet" + std::to_string(position) + ".xml";
      }
      if (!archive.contains(part)) {
        return;
      }
      sheets.push_back(read_sheet(archive, part, entry.attribute("name").value(), shared));
    });

    if (sheets.empty()) {
      fail("workbook contains no worksheets");
    }
    return render_sheets(sheets);
  } catch (const ExtractionError&) {
    throw;
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

}  // namespace lumina_core
