#include "lumina_core/extractors/xml_parts.hpp"

#include <stdexcept>

namespace lumina_core::xml_parts {

namespace {

std::string_view strip_prefix(std::string_view name) {
  auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string rels_part_for(const std::string& source_part) {
  if (source_part.empty()) {
    return "_rels/.rels";
  }
  auto slash = source_part.rfind('/');
  std::string directory = slash == std::string::npos ? "" : source_part.substr(0, slash + 1);
  std::string file = slash == std::string::npos ? source_part : source_part.substr(slash + 1);
  return directory + "_rels/" + file + ".rels";
}

}  // namespace

std::string_view local_name(const pugi::xml_node& node) {
  return strip_prefix(node.name());
}

void for_each_element(const pugi::xml_node& root,
                      std::string_view name,
                      const std::function<void(const pugi::xml_node&)>& visit) {
  for (pugi::xml_node child = root.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    if (local_name(child) == name) {
      visit(child);
    }
    for_each_element(child, name, visit);
  }
}

pugi::xml_node first_element(const pugi::xml_node& root, std::string_view name) {
  for (pugi::xml_node child = root.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    if (local_name(child) == name) {
      return child;
    }
    if (pugi::xml_node found = first_element(child, name)) {
      return found;
    }
  }
  return pugi::xml_node();
}

pugi::xml_node child_element(const pugi::xml_node& parent, std::string_view name) {
  for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element && local_name(child) == name) {
      return child;
    }
  }
  return pugi::xml_node();
}

std::string attribute(const pugi::xml_node& node, std::string_view name, bool prefixed_only) {
  for (pugi::xml_attribute attr = node.first_attribute(); attr; attr = attr.next_attribute()) {
    std::string_view full = attr.name();
    bool prefixed = full.find(':') != std::string_view::npos;
    if (prefixed_only && !prefixed) {
      continue;
    }
    if (strip_prefix(full) == name) {
      return attr.value();
    }
  }
  return "";
}

std::string joined_text(const pugi::xml_node& root, std::string_view text_element) {
  std::string text;
  for_each_element(root, text_element,
                   [&text](const pugi::xml_node& node) { text += node.text().get(); });
  return text;
}

void load_part(const ZipArchive& archive, const std::string& part, pugi::xml_document& doc) {
  std::string content = archive.read(part);
  pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size());
  if (!result) {
    throw std::runtime_error("Malformed XML in " + part + ": " + result.description());
  }
}

std::unordered_map<std::string, std::string> load_relationships(const ZipArchive& archive,
                                                                const std::string& source_part) {
  std::unordered_map<std::string, std::string> relationships;
  const std::string rels_part = rels_part_for(source_part);
  if (!archive.contains(rels_part)) {
    return relationships;
  }

  pugi::xml_document doc;
  load_part(archive, rels_part, doc);
  for_each_element(doc, "Relationship", [&](const pugi::xml_node& rel) {
    if (std::string(rel.attribute("TargetMode").value()) == "External") {
      return;
    }
    relationships[rel.attribute("Id").value()] =
        resolve_part_path(source_part, rel.attribute("Target").value());
  });
  return relationships;
}

std::string related_part(const ZipArchive& archive,
                         const std::string& source_part,
                         std::string_view type_suffix) {
  const std::string rels_part = rels_part_for(source_part);
  if (!archive.contains(rels_part)) {
    return "";
  }

  pugi::xml_document doc;
  load_part(archive, rels_part, doc);
  std::string found;
  for_each_element(doc, "Relationship", [&](const pugi::xml_node& rel) {
    std::string_view type = rel.attribute("Type").value();
    if (found.empty() && type.ends_with(type_suffix) &&
        std::string(rel.attribute("TargetMode").value()) != "External") {
      found = resolve_part_path(source_part, rel.attribute("Target").value());
    }
  });
  return found;
}

std::string main_part(const ZipArchive& archive, const std::string& fallback) {
  std::string found = related_part(archive, "", "/officeDocument");
  if (!found.empty() && archive.contains(found)) {
    return found;
  }
  return fallback;
}

}  // namespace lumina_core::xml_parts
