#include "frame_writer.hh"

#include <fmt/format.h>

#include <cassert>
#include <iterator>

namespace avroshard {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

std::string format_cell(const Cell &cell,
                        const std::vector<std::string> *domain) {
  return std::visit(
      Overloaded{
          [](std::monostate) { return std::string("NA"); },
          [&](const ScaledCell &v) {
            if (domain != nullptr && v.exponent == 0 && v.mantissa >= 0 &&
                static_cast<std::size_t>(v.mantissa) < domain->size()) {
              return (*domain)[static_cast<std::size_t>(v.mantissa)];
            }
            if (v.exponent == 0) {
              return fmt::format("{}", v.mantissa);
            }
            return fmt::format("{}e{}", v.mantissa, v.exponent);
          },
          [](double v) { return fmt::format("{}", v); },
          [](const std::string &v) { return v; },
      },
      cell);
}

FrameWriter::FrameWriter(std::size_t column_count)
    : columns_(column_count), invalid_counts_(column_count, 0) {}

void FrameWriter::push(ColumnIndex col, Cell cell) {
  assert(col < columns_.size());
  assert(columns_[col].size() == rows_);
  columns_[col].push_back(std::move(cell));
}

void FrameWriter::add_numeric_cell(ColumnIndex col, int64_t mantissa,
                                   int32_t exponent) {
  push(col, ScaledCell{mantissa, exponent});
}

void FrameWriter::add_numeric_cell(ColumnIndex col, double value) {
  push(col, value);
}

void FrameWriter::add_string_cell(ColumnIndex col, std::string_view bytes) {
  push(col, std::string(bytes));
}

void FrameWriter::add_invalid_cell(ColumnIndex col) {
  push(col, std::monostate{});
  ++invalid_counts_[col];
}

void FrameWriter::end_row() {
  for ([[maybe_unused]] const auto &column : columns_) {
    assert(column.size() == rows_ + 1);
  }
  ++rows_;
}

void FrameWriter::append(FrameWriter &&other) {
  assert(other.columns_.size() == columns_.size());
  for (std::size_t i = 0; i < columns_.size(); i++) {
    auto &src = other.columns_[i];
    columns_[i].insert(columns_[i].end(), std::make_move_iterator(src.begin()),
                       std::make_move_iterator(src.end()));
    invalid_counts_[i] += other.invalid_counts_[i];
  }
  rows_ += other.rows_;
  other.columns_.assign(columns_.size(), {});
  other.invalid_counts_.assign(columns_.size(), 0);
  other.rows_ = 0;
}

}  // namespace avroshard
