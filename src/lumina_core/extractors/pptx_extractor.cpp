#include "lumina_core/extractors/pptx_extractor.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <cctype>

#include "lumina_core/extractors/xml_parts.hpp"

namespace lumina_core {

namespace {

const std::string SLIDE_PREFIX = "ppt/slides/slide";

// "ppt/slides/slide12.xml" -> 12, or -1 for anything else.
long slide_number(const std::string& name) {
  if (name.rfind(SLIDE_PREFIX, 0) != 0 || !name.ends_with(".xml")) {
    return -1;
  }
  std::string digits = name.substr(SLIDE_PREFIX.size(), name.size() - SLIDE_PREFIX.size() - 4);
  if (digits.empty() ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return -1;
  }
  return std::stol(digits);
}

std::vector<std::string> slides_by_name(const ZipArchive& archive) {
  std::vector<std::pair<long, std::string>> numbered;
  for (const auto& name : archive.entry_names()) {
    long number = slide_number(name);
    if (number >= 0) {
      numbered.emplace_back(number, name);
    }
  }
  std::sort(numbered.begin(), numbered.end());

  std::vector<std::string> parts;
  for (auto& [number, name] : numbered) {
    parts.push_back(std::move(name));
  }
  return parts;
}

std::string slide_text(const pugi::xml_node& root) {
  std::vector<std::string> lines;
  xml_parts::for_each_element(root, "p", [&lines](const pugi::xml_node& paragraph) {
    std::string line;
    for (pugi::xml_node child = paragraph.first_child(); child; child = child.next_sibling()) {
      std::string_view name = xml_parts::local_name(child);
      if (name == "r" || name == "fld") {
        line += xml_parts::joined_text(child, "t");
      } else if (name == "br") {
        line += '\n';
      }
    }
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  });

  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      text += '\n';
    }
    text += lines[i];
  }
  return text;
}

}  // namespace

std::vector<std::string> PptxExtractor::slide_parts(const ZipArchive& archive) {
  const std::string presentation = xml_parts::main_part(archive, "ppt/presentation.xml");
  if (archive.contains(presentation)) {
    pugi::xml_document doc;
    xml_parts::load_part(archive, presentation, doc);
    auto relationships = xml_parts::load_relationships(archive, presentation);

    std::vector<std::string> ordered;
    xml_parts::for_each_element(doc, "sldId", [&](const pugi::xml_node& slide) {
      auto target = relationships.find(xml_parts::attribute(slide, "id", true));
      if (target != relationships.end() && archive.contains(target->second)) {
        ordered.push_back(target->second);
      }
    });
    if (!ordered.empty()) {
      return ordered;
    }
  }
  return slides_by_name(archive);
}

std::string PptxExtractor::extract(const Bytes& bytes) const {
  try {
    ZipArchive archive(bytes);
    std::vector<std::string> parts = slide_parts(archive);
    if (parts.empty()) {
      fail("presentation contains no slides");
    }

    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
      pugi::xml_document slide;
      xml_parts::load_part(archive, parts[i], slide);
      if (i > 0) {
        text += "\n\n";
      }
      text += "--- Slide " + std::to_string(i + 1) + " ---\n";
      text += slide_text(slide);
    }
    return text;
  } catch (const ExtractionError&) {
    throw;
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

}  // namespace lumina_core
