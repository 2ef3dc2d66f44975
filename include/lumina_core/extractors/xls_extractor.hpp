#pragma once

#include <string>
#include <vector>

#include "content_extractor.hpp"
#include "sheet_text.hpp"

namespace lumina_core {

/**
 * @class XlsExtractor
 * @brief Legacy binary spreadsheets (BIFF8 workbook stream inside a compound document).
 *
 * Reads the shared string table and sheet directory from the workbook globals,
 * then the cell records of every worksheet. Cached formula results are used;
 * nothing is recalculated. Earlier BIFF versions are rejected.
 */
class XlsExtractor : public ContentExtractor {
 public:
  FormatTag get_format() const override {
    return FormatTag::SpreadsheetLegacy;
  }
  std::string extract(const Bytes& bytes) const override;

  // Worksheets of a raw BIFF8 workbook stream. Throws std::runtime_error on malformed records.
  static std::vector<SheetCells> read_workbook(const Bytes& stream);
};

}  // namespace lumina_core
