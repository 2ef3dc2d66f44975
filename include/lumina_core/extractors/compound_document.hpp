#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lumina_core/types/document.hpp"

namespace lumina_core {

/**
 * @class CompoundDocument
 * @brief Reader for the structured storage container used by legacy Office files.
 *
 * Parses the header, sector allocation tables and directory, and reads named
 * streams from either the regular or the mini stream. Malformed containers
 * throw std::runtime_error.
 */
class CompoundDocument {
 public:
  static constexpr std::uint8_t SIGNATURE[8] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};

  explicit CompoundDocument(const Bytes& bytes);

  bool has_stream(const std::string& name) const;
  // Case-insensitive lookup by directory entry name.
  std::optional<Bytes> read_stream(const std::string& name) const;
  std::vector<std::string> stream_names() const;

  static bool has_signature(const Bytes& bytes);

 private:
  struct Entry {
    std::string name;
    std::uint8_t type;
    std::uint32_t start_sector;
    std::uint64_t size;
  };

  std::vector<std::uint32_t> chain(std::uint32_t start, const std::vector<std::uint32_t>& table) const;
  Bytes read_chain(std::uint32_t start, std::uint64_t size) const;
  Bytes read_mini_chain(std::uint32_t start, std::uint64_t size) const;
  const std::uint8_t* sector(std::uint32_t index) const;
  const Entry* find(const std::string& name) const;

  const Bytes& bytes_;
  size_t sector_size_;
  size_t mini_sector_size_;
  std::uint32_t mini_cutoff_;
  std::vector<std::uint32_t> fat_;
  std::vector<std::uint32_t> mini_fat_;
  std::vector<Entry> entries_;
  Bytes mini_stream_;
};

// Little-endian UTF-16 code units to UTF-8. Unpaired surrogates become U+FFFD.
std::string utf16le_to_utf8(const std::uint8_t* data, size_t unit_count);

}  // namespace lumina_core
