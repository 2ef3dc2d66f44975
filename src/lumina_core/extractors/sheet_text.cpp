#include "lumina_core/extractors/sheet_text.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace lumina_core {

namespace {

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::string render_sheets(const std::vector<SheetCells>& sheets) {
  std::string text;
  for (const auto& sheet : sheets) {
    size_t first_column = std::string::npos;
    for (const auto& [row, cells] : sheet.rows) {
      if (!cells.empty() && cells.begin()->first < first_column) {
        first_column = cells.begin()->first;
      }
    }

    if (!text.empty()) {
      text += "\n\n";
    }
    text += "=== Sheet: " + sheet.name + " ===";

    for (const auto& [row, cells] : sheet.rows) {
      if (cells.empty()) {
        continue;
      }
      std::string line;
      const size_t last_column = cells.rbegin()->first;
      for (size_t column = first_column; column <= last_column; ++column) {
        if (column > first_column) {
          line += '\t';
        }
        auto cell = cells.find(column);
        if (cell != cells.end()) {
          line += cell->second;
        }
      }
      if (!is_blank(line)) {
        text += '\n';
        text += line;
      }
    }
  }
  return text;
}

std::string format_number(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    std::ostringstream integral;
    integral << static_cast<long long>(value);
    return integral.str();
  }
  std::ostringstream stream;
  stream << std::setprecision(15) << value;
  return stream.str();
}

size_t column_from_reference(const std::string& reference) {
  size_t column = 0;
  bool seen_letter = false;
  for (char c : reference) {
    if (c >= 'A' && c <= 'Z') {
      column = column * 26 + static_cast<size_t>(c - 'A' + 1);
      seen_letter = true;
    } else if (c >= 'a' && c <= 'z') {
      column = column * 26 + static_cast<size_t>(c - 'a' + 1);
      seen_letter = true;
    } else {
      break;
    }
  }
  return seen_letter ? column - 1 : std::string::npos;
}

}  // namespace lumina_core
