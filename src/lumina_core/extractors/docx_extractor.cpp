#include "lumina_core/extractors/docx_extractor.hpp"

#include "lumina_core/extractors/markup_text.hpp"
#include "lumina_core/extractors/xml_parts.hpp"
#include "lumina_core/extractors/zip_archive.hpp"

namespace lumina_core {

namespace {

using xml_parts::attribute;
using xml_parts::child_element;
using xml_parts::local_name;

constexpr unsigned char COMPOUND_DOCUMENT_LEAD = 0xD0;

std::string paragraph_tag(const pugi::xml_node& paragraph) {
  pugi::xml_node properties = child_element(paragraph, "pPr");
  if (!properties) {
    return "p";
  }
  std::string style = attribute(child_element(properties, "pStyle"), "val");
  if (style == "Title") {
    return "h1";
  }
  // Heading1 .. Heading6
  if (style.rfind("Heading", 0) == 0 && style.size() == 8 && style[7] >= '1' && style[7] <= '6') {
    return std::string("h") + style[7];
  }
  if (child_element(properties, "numPr")) {
    return "li";
  }
  return "p";
}

void append_runs(const pugi::xml_node& node, std::string& html) {
  for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    std::string_view name = local_name(child);
    if (name == "t") {
      html += escape_markup(child.text().get());
    } else if (name == "tab") {
      html += '\t';
    } else if (name == "br" || name == "cr") {
      html += "<br/>";
    } else if (name == "noBreakHyphen") {
      html += '-';
    } else if (name == "pPr" || name == "rPr" || name == "delText" || name == "instrText") {
      continue;
    } else {
      // Runs, hyperlinks, smart tags, content controls, insertions.
      append_runs(child, html);
    }
  }
}

void append_block(const pugi::xml_node& node, std::string& html);

void append_blocks(const pugi::xml_node& container, std::string& html) {
  for (pugi::xml_node child = container.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element) {
      append_block(child, html);
    }
  }
}

void append_block(const pugi::xml_node& node, std::string& html) {
  std::string_view name = local_name(node);
  if (name == "p") {
    const std::string tag = paragraph_tag(node);
    html += "<" + tag + ">";
    append_runs(node, html);
    html += "</" + tag + ">";
  } else if (name == "tbl") {
    html += "<table>";
    for (pugi::xml_node row = node.first_child(); row; row = row.next_sibling()) {
      if (row.type() != pugi::node_element || local_name(row) != "tr") {
        continue;
      }
      html += "<tr>";
      for (pugi::xml_node cell = row.first_child(); cell; cell = cell.next_sibling()) {
        if (cell.type() != pugi::node_element || local_name(cell) != "tc") {
          continue;
        }
        html += "<td>";
        append_blocks(cell, html);
        html += "</td>";
      }
      html += "</tr>";
    }
    html += "</table>";
  } else if (name == "sdt") {
    append_blocks(child_element(node, "sdtContent"), html);
  } else if (name == "customXml" || name == "ins" || name == "smartTag") {
    append_blocks(node, html);
  }
}

}  // namespace

std::string DocxExtractor::to_markup(const pugi::xml_document& document) {
  pugi::xml_node body = child_element(child_element(document, "document"), "body");
  std::string html = "<html><body>";
  append_blocks(body, html);
  html += "</body></html>";
  return html;
}

std::string DocxExtractor::extract(const Bytes& bytes) const {
  if (!bytes.empty() && bytes.front() == COMPOUND_DOCUMENT_LEAD) {
    fail("legacy binary word documents are not supported");
  }

  try {
    ZipArchive archive(bytes);
    pugi::xml_document document;
    xml_parts::load_part(archive, xml_parts::main_part(archive, "word/document.xml"), document);
    if (!child_element(child_element(document, "document"), "body")) {
      fail("word/document.xml has no body");
    }
    return markup_to_text(to_markup(document));
  } catch (const ExtractionError&) {
    throw;
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

}  // namespace lumina_core
