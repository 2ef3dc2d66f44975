#include "lumina_core/extractors/xls_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "lumina_core/extractors/compound_document.hpp"

namespace lumina_core {

namespace {

namespace record {
constexpr std::uint16_t FORMULA = 0x0006;
constexpr std::uint16_t END_OF_FILE = 0x000A;
constexpr std::uint16_t CONTINUE = 0x003C;
constexpr std::uint16_t BOUNDSHEET = 0x0085;
constexpr std::uint16_t MULRK = 0x00BD;
constexpr std::uint16_t RSTRING = 0x00D6;
constexpr std::uint16_t SST = 0x00FC;
constexpr std::uint16_t LABELSST = 0x00FD;
constexpr std::uint16_t NUMBER = 0x0203;
constexpr std::uint16_t LABEL = 0x0204;
constexpr std::uint16_t BOOLERR = 0x0205;
constexpr std::uint16_t STRING = 0x0207;
constexpr std::uint16_t RK = 0x027E;
constexpr std::uint16_t BOF = 0x0809;
}  // namespace record

constexpr std::uint16_t BIFF8_VERSION = 0x0600;
constexpr std::uint8_t WORKSHEET_TYPE = 0x00;

std::uint16_t read_u16(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

double read_double(const std::uint8_t* p) {
  std::uint64_t bits = static_cast<std::uint64_t>(read_u32(p)) |
                       (static_cast<std::uint64_t>(read_u32(p + 4)) << 32);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

double decode_rk(std::uint32_t rk) {
  double value;
  if (rk & 0x02) {
    value = static_cast<double>(static_cast<std::int32_t>(rk) >> 2);
  } else {
    std::uint64_t bits = static_cast<std::uint64_t>(rk & 0xFFFFFFFC) << 32;
    std::memcpy(&value, &bits, sizeof(value));
  }
  return (rk & 0x01) ? value / 100.0 : value;
}

std::string error_text(std::uint8_t code) {
  switch (code) {
    case 0x00:
      return "#NULL!";
    case 0x07:
      return "#DIV/0!";
    case 0x0F:
      return "#VALUE!";
    case 0x17:
      return "#REF!";
    case 0x1D:
      return "#NAME?";
    case 0x24:
      return "#NUM!";
    case 0x2A:
      return "#N/A";
    default:
      return "#ERR";
  }
}

struct Record {
  std::uint16_t type;
  const std::uint8_t* data;
  size_t size;
};

// Sequential record iterator over a workbook stream.
class RecordStream {
 public:
  explicit RecordStream(const Bytes& stream) : stream_(stream), position_(0) {}

  void seek(size_t position) {
    if (position >= stream_.size()) {
      throw std::runtime_error("Sheet offset outside the workbook stream");
    }
    position_ = position;
  }

  bool next(Record& out) {
    if (position_ + 4 > stream_.size()) {
      return false;
    }
    const std::uint8_t* header = stream_.data() + position_;
    out.type = read_u16(header);
    out.size = read_u16(header + 2);
    if (position_ + 4 + out.size > stream_.size()) {
      throw std::runtime_error("Truncated record in workbook stream");
    }
    out.data = header + 4;
    position_ += 4 + out.size;
    return true;
  }

  bool peek_type(std::uint16_t& type) const {
    if (position_ + 4 > stream_.size()) {
      return false;
    }
    type = read_u16(stream_.data() + position_);
    return true;
  }

 private:
  const Bytes& stream_;
  size_t position_;
};

/**
 * Reads across a record and its CONTINUE records. Character data split at a
 * segment boundary is resumed after a fresh option byte, which may switch
 * between compressed and 16-bit characters.
 */
class SegmentReader {
 public:
  void add(const std::uint8_t* data, size_t size) {
    segments_.emplace_back(data, size);
  }

  std::uint8_t u8() {
    ensure_available();
    return segments_[segment_].first[offset_++];
  }

  std::uint16_t u16() {
    std::uint16_t low = u8();
    return static_cast<std::uint16_t>(low | (u8() << 8));
  }

  std::uint32_t u32() {
    std::uint32_t low = u16();
    return low | (static_cast<std::uint32_t>(u16()) << 16);
  }

  void skip(size_t count) {
    while (count > 0) {
      ensure_available();
      size_t step = std::min(count, segments_[segment_].second - offset_);
      offset_ += step;
      count -= step;
    }
  }

  std::string characters(size_t count, bool wide) {
    std::string out;
    auto inserter = std::back_inserter(out);
    while (count > 0) {
      if (offset_ == segments_[segment_].second) {
        advance();
        wide = (u8() & 0x01) != 0;
      }
      const size_t width = wide ? 2 : 1;
      size_t available = (segments_[segment_].second - offset_) / width;
      if (available == 0) {
        throw std::runtime_error("Character data split inside a code unit");
      }
      size_t take = std::min(count, available);
      const std::uint8_t* data = segments_[segment_].first + offset_;
      if (wide) {
        out += utf16le_to_utf8(data, take);
      } else {
        for (size_t i = 0; i < take; ++i) {
          utf8::append(static_cast<std::uint32_t>(data[i]), inserter);
        }
      }
      offset_ += take * width;
      count -= take;
    }
    return out;
  }

  // XLUnicodeRichExtendedString as stored in the shared string table.
  std::string rich_string() {
    const size_t count = u16();
    const std::uint8_t flags = u8();
    size_t runs = 0;
    size_t extension = 0;
    if (flags & 0x08) {
      runs = u16();
    }
    if (flags & 0x04) {
      extension = u32();
    }
    std::string text = characters(count, (flags & 0x01) != 0);
    skip(runs * 4 + extension);
    return text;
  }

 private:
  void advance() {
    if (segment_ + 1 >= segments_.size()) {
      throw std::runtime_error("Shared string table ends early");
    }
    ++segment_;
    offset_ = 0;
  }

  void ensure_available() {
    while (offset_ >= segments_[segment_].second) {
      advance();
    }
  }

  std::vector<std::pair<const std::uint8_t*, size_t>> segments_;
  size_t segment_ = 0;
  size_t offset_ = 0;
};

// XLUnicodeString contained in a single record (LABEL, RSTRING, STRING).
std::string unicode_string(const Record& rec, size_t offset) {
  if (offset + 3 > rec.size) {
    throw std::runtime_error("Truncated string record");
  }
  SegmentReader reader;
  reader.add(rec.data + offset, rec.size - offset);
  const size_t count = reader.u16();
  const bool wide = (reader.u8() & 0x01) != 0;
  return reader.characters(count, wide);
}

void require(const Record& rec, size_t size) {
  if (rec.size < size) {
    throw std::runtime_error("Truncated cell record");
  }
}

struct SheetEntry {
  std::uint32_t offset;
  std::uint8_t type;
  std::string name;
};

struct Globals {
  std::vector<std::string> shared_strings;
  std::vector<SheetEntry> sheets;
};

Globals read_globals(RecordStream& records) {
  Globals globals;
  Record rec{};
  int depth = 0;
  while (records.next(rec)) {
    if (rec.type == record::BOF) {
      ++depth;
    } else if (rec.type == record::END_OF_FILE) {
      if (--depth <= 0) {
        break;
      }
    } else if (rec.type == record::BOUNDSHEET && depth == 1) {
      if (rec.size < 8) {
        throw std::runtime_error("Truncated sheet record");
      }
      SegmentReader reader;
      reader.add(rec.data + 6, rec.size - 6);
      const size_t count = reader.u8();
      const bool wide = (reader.u8() & 0x01) != 0;
      globals.sheets.push_back(SheetEntry{.offset = read_u32(rec.data),
                                          .type = rec.data[5],
                                          .name = reader.characters(count, wide)});
    } else if (rec.type == record::SST && depth == 1) {
      if (rec.size < 8) {
        throw std::runtime_error("Truncated shared string table");
      }
      SegmentReader reader;
      reader.add(rec.data + 8, rec.size - 8);
      std::uint16_t next_type = 0;
      while (records.peek_type(next_type) && next_type == record::CONTINUE) {
        Record continuation{};
        records.next(continuation);
        reader.add(continuation.data, continuation.size);
      }
      const std::uint32_t unique = read_u32(rec.data + 4);
      globals.shared_strings.reserve(unique);
      for (std::uint32_t i = 0; i < unique; ++i) {
        globals.shared_strings.push_back(reader.rich_string());
      }
    }
  }
  return globals;
}

SheetCells read_sheet(RecordStream& records, const SheetEntry& entry, const Globals& globals) {
  SheetCells sheet{.name = entry.name, .rows = {}};
  records.seek(entry.offset);

  Record rec{};
  int depth = 0;
  bool pending_string = false;
  size_t pending_row = 0;
  size_t pending_column = 0;

  while (records.next(rec)) {
    if (rec.type == record::BOF) {
      ++depth;
      continue;
    }
    if (rec.type == record::END_OF_FILE) {
      if (--depth <= 0) {
        break;
      }
      continue;
    }
    if (depth != 1) {
      continue;
    }

    switch (rec.type) {
      case record::LABELSST: {
        require(rec, 10);
        std::uint32_t index = read_u32(rec.data + 6);
        if (index < globals.shared_strings.size()) {
          sheet.set(read_u16(rec.data), read_u16(rec.data + 2), globals.shared_strings[index]);
        }
        break;
      }
      case record::LABEL:
      case record::RSTRING:
        require(rec, 9);
        sheet.set(read_u16(rec.data), read_u16(rec.data + 2), unicode_string(rec, 6));
        break;
      case record::NUMBER:
        require(rec, 14);
        sheet.set(read_u16(rec.data), read_u16(rec.data + 2), format_number(read_double(rec.data + 6)));
        break;
      case record::RK:
        require(rec, 10);
        sheet.set(read_u16(rec.data), read_u16(rec.data + 2),
                  format_number(decode_rk(read_u32(rec.data + 6))));
        break;
      case record::MULRK: {
        require(rec, 6);
        const size_t row = read_u16(rec.data);
        size_t column = read_u16(rec.data + 2);
        for (size_t offset = 4; offset + 6 <= rec.size - 2; offset += 6, ++column) {
          sheet.set(row, column, format_number(decode_rk(read_u32(rec.data + offset + 2))));
        }
        break;
      }
      case record::BOOLERR: {
        require(rec, 8);
        const std::uint8_t value = rec.data[6];
        const bool is_error = rec.data[7] != 0;
        sheet.set(read_u16(rec.data), read_u16(rec.data + 2),
                  is_error ? error_text(value) : (value ? "TRUE" : "FALSE"));
        break;
      }
      case record::FORMULA: {
        require(rec, 20);
        const size_t row = read_u16(rec.data);
        const size_t column = read_u16(rec.data + 2);
        const std::uint8_t* result = rec.data + 6;
        if (read_u16(result + 6) != 0xFFFF) {
          sheet.set(row, column, format_number(read_double(result)));
        } else if (result[0] == 0x00) {
          pending_string = true;
          pending_row = row;
          pending_column = column;
        } else if (result[0] == 0x01) {
          sheet.set(row, column, result[2] ? "TRUE" : "FALSE");
        } else if (result[0] == 0x02) {
          sheet.set(row, column, error_text(result[2]));
        }
        break;
      }
      case record::STRING:
        if (pending_string) {
          sheet.set(pending_row, pending_column, unicode_string(rec, 0));
          pending_string = false;
        }
        break;
      default:
        break;
    }
  }
  return sheet;
}

}  // namespace

std::vector<SheetCells> XlsExtractor::read_workbook(const Bytes& stream) {
  RecordStream records(stream);
  Record first{};
  if (!records.next(first) || first.type != record::BOF || first.size < 4) {
    throw std::runtime_error("Workbook stream does not start with a BOF record");
  }
  if (read_u16(first.data) != BIFF8_VERSION) {
    throw std::runtime_error("Only BIFF8 workbooks are supported");
  }

  RecordStream globals_stream(stream);
  Globals globals = read_globals(globals_stream);

  std::vector<SheetCells> sheets;
  for (const auto& entry : globals.sheets) {
    if (entry.type != WORKSHEET_TYPE) {
      continue;
    }
    RecordStream sheet_records(stream);
    sheets.push_back(read_sheet(sheet_records, entry, globals));
  }
  return sheets;
}

std::string XlsExtractor::extract(const Bytes& bytes) const {
  try {
    CompoundDocument container(bytes);
    std::optional<Bytes> workbook = container.read_stream("Workbook");
    if (!workbook) {
      if (container.has_stream("Book")) {
        fail("BIFF5 and older workbooks are not supported");
      }
      fail("compound document has no Workbook stream");
    }

    std::vector<SheetCells> sheets = read_workbook(*workbook);
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
