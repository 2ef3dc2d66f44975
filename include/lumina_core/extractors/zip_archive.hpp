#pragma once

#include <zip.h>

#include <string>
#include <vector>

#include "lumina_core/types/document.hpp"

namespace lumina_core {

/**
 * @class ZipArchive
 * @brief Read-only view of an in-memory ZIP container (docx, pptx, xlsx, epub).
 *
 * The archive borrows the byte buffer; it must outlive this object.
 * Entry lookups are case-insensitive. Failures throw std::runtime_error.
 */
class ZipArchive {
 public:
  explicit ZipArchive(const Bytes& bytes);
  ~ZipArchive();

  bool contains(const std::string& name) const;
  std::string read(const std::string& name) const;
  std::vector<std::string> entry_names() const;

  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;
  ZipArchive(ZipArchive&&) = delete;
  ZipArchive& operator=(ZipArchive&&) = delete;

 private:
  zip_t* archive_;
};

// Resolves a relationship target against the directory of the part that references it.
std::string resolve_part_path(const std::string& base_part, const std::string& target);

}  // namespace lumina_core
