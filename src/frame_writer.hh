#pragma once

#include "noncopyable.hh"
#include "parse_writer.hh"

#include <string>
#include <variant>
#include <vector>

namespace avroshard {

struct ScaledCell {
  int64_t mantissa;
  int32_t exponent;

  bool operator==(const ScaledCell &) const = default;
};

// monostate marks an invalid cell
using Cell = std::variant<std::monostate, ScaledCell, double, std::string>;

// Renders a cell for display. Categorical ordinals become labels when a
// domain is given.
std::string format_cell(const Cell &cell,
                        const std::vector<std::string> *domain = nullptr);

// Column-major in-memory frame.
class FrameWriter final : public ParseWriter, NonCopyable {
public:
  explicit FrameWriter(std::size_t column_count);

  void add_numeric_cell(ColumnIndex col, int64_t mantissa,
                        int32_t exponent) final;
  void add_numeric_cell(ColumnIndex col, double value) final;
  void add_string_cell(ColumnIndex col, std::string_view bytes) final;
  void add_invalid_cell(ColumnIndex col) final;
  void end_row() final;

  // Appends the rows of `other`, which must have the same column count.
  void append(FrameWriter &&other);

  std::size_t column_count() const {
    return columns_.size();
  }

  std::size_t row_count() const {
    return rows_;
  }

  const Cell &cell(std::size_t row, ColumnIndex col) const {
    return columns_[col][row];
  }

  const std::vector<Cell> &column(ColumnIndex col) const {
    return columns_[col];
  }

  uint64_t invalid_count(ColumnIndex col) const {
    return invalid_counts_[col];
  }

private:
  void push(ColumnIndex col, Cell cell);

  std::vector<std::vector<Cell>> columns_;
  std::vector<uint64_t> invalid_counts_;
  std::size_t rows_ = 0;
};

}  // namespace avroshard
