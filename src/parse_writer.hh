#pragma once

#include <cstdint>
#include <string_view>

namespace avroshard {

using ColumnIndex = uint32_t;

// Receives parsed rows one cell at a time. A row is exactly one cell per
// column followed by end_row().
class ParseWriter {
public:
  virtual ~ParseWriter() = default;

  // value = mantissa * 10^exponent
  virtual void add_numeric_cell(ColumnIndex col, int64_t mantissa,
                                int32_t exponent) = 0;
  virtual void add_numeric_cell(ColumnIndex col, double value) = 0;
  virtual void add_string_cell(ColumnIndex col, std::string_view bytes) = 0;
  virtual void add_invalid_cell(ColumnIndex col) = 0;
  virtual void end_row() = 0;
};

}  // namespace avroshard
