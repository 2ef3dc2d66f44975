#include "lumina_core/extractors/epub_extractor.hpp"

#include <pugixml.hpp>

#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "lumina_core/acquisition/document_fetcher.hpp"
#include "lumina_core/extractors/markup_text.hpp"
#include "lumina_core/extractors/text_decoder.hpp"
#include "lumina_core/extractors/xml_parts.hpp"

namespace lumina_core {

namespace {

const std::string CONTAINER_PART = "META-INF/container.xml";

bool is_content_type(const std::string& media_type) {
  return media_type == "application/xhtml+xml" || media_type == "text/html";
}

std::string package_path(const ZipArchive& archive) {
  if (!archive.contains(CONTAINER_PART)) {
    throw std::runtime_error("missing " + CONTAINER_PART);
  }
  pugi::xml_document container;
  xml_parts::load_part(archive, CONTAINER_PART, container);
  std::string path = xml_parts::first_element(container, "rootfile").attribute("full-path").value();
  if (path.empty()) {
    throw std::runtime_error("container.xml names no package document");
  }
  return path;
}

}  // namespace

std::vector<std::string> EpubExtractor::content_documents(const ZipArchive& archive) {
  const std::string opf = package_path(archive);
  pugi::xml_document package;
  xml_parts::load_part(archive, opf, package);

  std::vector<std::string> manifest_order;
  std::unordered_map<std::string, std::string> paths;
  xml_parts::for_each_element(package, "item", [&](const pugi::xml_node& item) {
    if (!is_content_type(item.attribute("media-type").value())) {
      return;
    }
    std::string href = item.attribute("href").value();
    auto fragment = href.find('#');
    if (fragment != std::string::npos) {
      href.erase(fragment);
    }
    std::string path = resolve_part_path(opf, percent_decode(href));
    manifest_order.push_back(item.attribute("id").value());
    paths[manifest_order.back()] = path;
  });

  std::vector<std::string> ordered;
  std::unordered_set<std::string> seen;
  auto take = [&](const std::string& id) {
    auto path = paths.find(id);
    if (path == paths.end() || !seen.insert(path->second).second) {
      return;
    }
    if (archive.contains(path->second)) {
      ordered.push_back(path->second);
    }
  };
  xml_parts::for_each_element(package, "itemref", [&](const pugi::xml_node& itemref) {
    take(itemref.attribute("idref").value());
  });
  for (const auto& id : manifest_order) {
    take(id);
  }
  return ordered;
}

std::string EpubExtractor::extract(const Bytes& bytes) const {
  try {
    ZipArchive archive(bytes);
    std::vector<std::string> documents = content_documents(archive);
    if (documents.empty()) {
      fail("ebook has no readable content documents");
    }

    std::string text;
    for (const auto& document : documents) {
      std::string section = markup_to_text(TextDecoder::decode(archive.read(document)).text);
      if (section.find_first_not_of(" \t\r\n") == std::string::npos) {
        continue;
      }
      if (!text.empty()) {
        text += "\n\n";
      }
      text += section;
    }
    return text;
  } catch (const ExtractionError&) {
    throw;
  } catch (const std::exception& e) {
    fail(e.what());
  }
}

}  // namespace lumina_core
