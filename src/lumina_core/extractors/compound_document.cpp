#include "lumina_core/extractors/compound_document.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <set>
#include <stdexcept>

namespace lumina_core {

namespace {

constexpr std::uint32_t END_OF_CHAIN = 0xFFFFFFFE;
constexpr std::uint32_t MAX_REGULAR_SECTOR = 0xFFFFFFFA;
constexpr size_t HEADER_SIZE = 512;
constexpr size_t HEADER_DIFAT_ENTRIES = 109;
constexpr size_t DIRECTORY_ENTRY_SIZE = 128;
constexpr std::uint8_t STREAM_OBJECT = 2;
constexpr std::uint8_t ROOT_OBJECT = 5;

std::uint16_t read_u16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint64_t read_u64(const std::uint8_t* p) {
  return static_cast<std::uint64_t>(read_u32(p)) |
         (static_cast<std::uint64_t>(read_u32(p + 4)) << 32);
}

std::string lowered(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

std::string utf16le_to_utf8(const std::uint8_t* data, size_t unit_count) {
  std::string out;
  out.reserve(unit_count);
  auto inserter = std::back_inserter(out);
  for (size_t i = 0; i < unit_count; ++i) {
    std::uint32_t unit = read_u16(data + i * 2);
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < unit_count) {
      std::uint32_t low = read_u16(data + (i + 1) * 2);
      if (low >= 0xDC00 && low <= 0xDFFF) {
        utf8::append(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00), inserter);
        ++i;
        continue;
      }
    }
    if (unit >= 0xD800 && unit <= 0xDFFF) {
      unit = 0xFFFD;
    }
    utf8::append(unit, inserter);
  }
  return out;
}

bool CompoundDocument::has_signature(const Bytes& bytes) {
  return bytes.size() >= sizeof(SIGNATURE) &&
         std::memcmp(bytes.data(), SIGNATURE, sizeof(SIGNATURE)) == 0;
}

CompoundDocument::CompoundDocument(const Bytes& bytes) : bytes_(bytes) {
  if (bytes_.size() < HEADER_SIZE || !has_signature(bytes_)) {
    throw std::runtime_error("Not a compound document");
  }
  const std::uint8_t* header = bytes_.data();

  const std::uint16_t sector_shift = read_u16(header + 0x1E);
  const std::uint16_t mini_shift = read_u16(header + 0x20);
  if (sector_shift != 9 && sector_shift != 12) {
    throw std::runtime_error("Unsupported compound document sector size");
  }
  if (mini_shift >= sector_shift) {
    throw std::runtime_error("Invalid compound document mini sector size");
  }
  sector_size_ = size_t{1} << sector_shift;
  mini_sector_size_ = size_t{1} << mini_shift;
  mini_cutoff_ = read_u32(header + 0x38);

  const std::uint32_t fat_sector_count = read_u32(header + 0x2C);
  const std::uint32_t first_directory = read_u32(header + 0x30);
  const std::uint32_t first_mini_fat = read_u32(header + 0x3C);
  const std::uint32_t mini_fat_count = read_u32(header + 0x40);
  std::uint32_t difat_sector = read_u32(header + 0x44);
  std::uint32_t difat_count = read_u32(header + 0x48);

  // No table can list more sectors than the file holds.
  const size_t sectors_in_file = bytes_.size() / sector_size_ - 1;
  if (fat_sector_count > sectors_in_file) {
    throw std::runtime_error("Compound document allocation table is larger than the file");
  }

  // Sector numbers of the allocation table, from the header and the DIFAT chain.
  std::vector<std::uint32_t> fat_sectors;
  for (size_t i = 0; i < HEADER_DIFAT_ENTRIES && fat_sectors.size() < fat_sector_count; ++i) {
    std::uint32_t index = read_u32(header + 0x4C + i * 4);
    if (index <= MAX_REGULAR_SECTOR) {
      fat_sectors.push_back(index);
    }
  }
  const size_t per_sector = sector_size_ / 4;
  std::set<std::uint32_t> visited_difat;
  while (difat_count-- > 0 && difat_sector <= MAX_REGULAR_SECTOR &&
         fat_sectors.size() < fat_sector_count) {
    if (!visited_difat.insert(difat_sector).second || visited_difat.size() > sectors_in_file) {
      throw std::runtime_error("Cyclic DIFAT chain in compound document");
    }
    const std::uint8_t* data = sector(difat_sector);
    for (size_t i = 0; i + 1 < per_sector && fat_sectors.size() < fat_sector_count; ++i) {
      std::uint32_t index = read_u32(data + i * 4);
      if (index <= MAX_REGULAR_SECTOR) {
        fat_sectors.push_back(index);
      }
    }
    difat_sector = read_u32(data + (per_sector - 1) * 4);
  }

  for (std::uint32_t index : fat_sectors) {
    const std::uint8_t* data = sector(index);
    for (size_t i = 0; i < per_sector; ++i) {
      fat_.push_back(read_u32(data + i * 4));
    }
  }

  for (std::uint32_t index : chain(first_directory, fat_)) {
    const std::uint8_t* data = sector(index);
    for (size_t offset = 0; offset + DIRECTORY_ENTRY_SIZE <= sector_size_;
         offset += DIRECTORY_ENTRY_SIZE) {
      const std::uint8_t* raw = data + offset;
      std::uint16_t name_bytes = read_u16(raw + 0x40);
      std::uint8_t type = raw[0x42];
      if (type == 0) {
        continue;
      }
      size_t units = name_bytes >= 2 ? std::min<size_t>(name_bytes / 2 - 1, 31) : 0;
      std::uint64_t size = read_u64(raw + 0x78);
      if (sector_size_ == 512) {
        size &= 0xFFFFFFFF;
      }
      entries_.push_back(Entry{.name = utf16le_to_utf8(raw, units),
                               .type = type,
                               .start_sector = read_u32(raw + 0x74),
                               .size = size});
    }
  }
  if (entries_.empty() || entries_.front().type != ROOT_OBJECT) {
    throw std::runtime_error("Compound document has no root directory entry");
  }

  if (mini_fat_count > 0 && first_mini_fat <= MAX_REGULAR_SECTOR) {
    for (std::uint32_t index : chain(first_mini_fat, fat_)) {
      const std::uint8_t* data = sector(index);
      for (size_t i = 0; i < per_sector; ++i) {
        mini_fat_.push_back(read_u32(data + i * 4));
      }
    }
  }
  const Entry& root = entries_.front();
  if (root.size > 0 && root.start_sector <= MAX_REGULAR_SECTOR) {
    mini_stream_ = read_chain(root.start_sector, root.size);
  }
}

// The header occupies the first sector slot, so sector N starts at (N + 1) * sector size.
const std::uint8_t* CompoundDocument::sector(std::uint32_t index) const {
  const size_t start = (static_cast<size_t>(index) + 1) * sector_size_;
  if (start + sector_size_ > bytes_.size()) {
    throw std::runtime_error("Compound document sector out of range");
  }
  return bytes_.data() + start;
}

std::vector<std::uint32_t> CompoundDocument::chain(std::uint32_t start,
                                                   const std::vector<std::uint32_t>& table) const {
  std::vector<std::uint32_t> sectors;
  std::uint32_t current = start;
  while (current != END_OF_CHAIN) {
    if (current > MAX_REGULAR_SECTOR || current >= table.size()) {
      throw std::runtime_error("Broken sector chain in compound document");
    }
    if (sectors.size() > table.size()) {
      throw std::runtime_error("Cyclic sector chain in compound document");
    }
    sectors.push_back(current);
    current = table[current];
  }
  return sectors;
}

Bytes CompoundDocument::read_chain(std::uint32_t start, std::uint64_t size) const {
  Bytes out;
  for (std::uint32_t index : chain(start, fat_)) {
    const std::uint8_t* data = sector(index);
    out.insert(out.end(), data, data + sector_size_);
    if (out.size() >= size) {
      break;
    }
  }
  if (out.size() < size) {
    throw std::runtime_error("Compound document stream is truncated");
  }
  out.resize(size);
  return out;
}

Bytes CompoundDocument::read_mini_chain(std::uint32_t start, std::uint64_t size) const {
  Bytes out;
  for (std::uint32_t index : chain(start, mini_fat_)) {
    const size_t offset = static_cast<size_t>(index) * mini_sector_size_;
    if (offset + mini_sector_size_ > mini_stream_.size()) {
      throw std::runtime_error("Mini sector out of range");
    }
    out.insert(out.end(), mini_stream_.begin() + offset,
               mini_stream_.begin() + offset + mini_sector_size_);
    if (out.size() >= size) {
      break;
    }
  }
  if (out.size() < size) {
    throw std::runtime_error("Compound document mini stream is truncated");
  }
  out.resize(size);
  return out;
}

const CompoundDocument::Entry* CompoundDocument::find(const std::string& name) const {
  const std::string wanted = lowered(name);
  for (const auto& entry : entries_) {
    if (entry.type == STREAM_OBJECT && lowered(entry.name) == wanted) {
      return &entry;
    }
  }
  return nullptr;
}

bool CompoundDocument::has_stream(const std::string& name) const {
  return find(name) != nullptr;
}

std::optional<Bytes> CompoundDocument::read_stream(const std::string& name) const {
  const Entry* entry = find(name);
  if (!entry) {
    return std::nullopt;
  }
  if (entry->size == 0) {
    return Bytes{};
  }
  if (entry->size < mini_cutoff_) {
    return read_mini_chain(entry->start_sector, entry->size);
  }
  return read_chain(entry->start_sector, entry->size);
}

std::vector<std::string> CompoundDocument::stream_names() const {
  std::vector<std::string> names;
  for (const auto& entry : entries_) {
    if (entry.type == STREAM_OBJECT) {
      names.push_back(entry.name);
    }
  }
  return names;
}

}  // namespace lumina_core
