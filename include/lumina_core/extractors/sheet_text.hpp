#pragma once

#include <map>
#include <string>
#include <vector>

namespace lumina_core {

// Cell values of one worksheet, keyed by zero-based row then column.
struct SheetCells {
  std::string name;
  std::map<size_t, std::map<size_t, std::string>> rows;

  void set(size_t row, size_t column, std::string value) {
    rows[row][column] = std::move(value);
  }
};

/**
 * Renders worksheets as text shared by the xlsx and xls extractors.
 *
 * Each sheet starts with "=== Sheet: <name> ===". Rows are emitted in order
 * with cells joined by tabs, from the sheet's first used column to the last
 * populated cell of the row. Rows that are empty after joining are dropped.
 * Sheets are separated by a blank line.
 */
std::string render_sheets(const std::vector<SheetCells>& sheets);

// Spreadsheet number as text: integral values without a fraction, others with 15 significant digits.
std::string format_number(double value);

// "BC12" -> 54 (zero-based column), or npos if the reference has no letters.
size_t column_from_reference(const std::string& reference);

}  // namespace lumina_core
