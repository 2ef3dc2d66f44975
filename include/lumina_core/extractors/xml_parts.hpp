#pragma once

#include <pugixml.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lumina_core/extractors/zip_archive.hpp"

namespace lumina_core::xml_parts {

// Element name without its namespace prefix ("w:p" -> "p").
std::string_view local_name(const pugi::xml_node& node);

// Visits every element below root, in document order, whose local name matches.
void for_each_element(const pugi::xml_node& root,
                      std::string_view name,
                      const std::function<void(const pugi::xml_node&)>& visit);

pugi::xml_node first_element(const pugi::xml_node& root, std::string_view name);

// First direct child element with the given local name.
pugi::xml_node child_element(const pugi::xml_node& parent, std::string_view name);

// Attribute lookup ignoring the prefix. With prefixed_only, "r:id" matches "id" but "id" does not.
std::string attribute(const pugi::xml_node& node, std::string_view name, bool prefixed_only = false);

// Concatenated text of all descendant elements with the given local name.
std::string joined_text(const pugi::xml_node& root, std::string_view text_element);

// Loads a container part. Throws std::runtime_error when it is missing or malformed.
void load_part(const ZipArchive& archive, const std::string& part, pugi::xml_document& doc);

// Relationship id -> absolute part path for the given source part ("" for package rels).
std::unordered_map<std::string, std::string> load_relationships(const ZipArchive& archive,
                                                                const std::string& source_part);

// First internal relationship of source_part whose type ends with type_suffix, or "".
std::string related_part(const ZipArchive& archive,
                         const std::string& source_part,
                         std::string_view type_suffix);

// Path of the main document part named by the package relationships.
std::string main_part(const ZipArchive& archive, const std::string& fallback);

}  // namespace lumina_core::xml_parts
