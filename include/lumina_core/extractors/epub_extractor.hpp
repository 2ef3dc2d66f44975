#pragma once

#include <string>
#include <vector>

#include "content_extractor.hpp"
#include "zip_archive.hpp"

namespace lumina_core {

/**
 * @class EpubExtractor
 * @brief Ebooks. Content documents are read in spine order, then any
 * remaining (X)HTML items of the manifest, each stripped like a web page.
 */
class EpubExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::Ebook;
  }
  std::string extract(const Bytes& bytes) const override;

  // Archive paths of the content documents in reading order.
  static std::vector<std::string> content_documents(const ZipArchive& archive);
};

}  // namespace lumina_core
