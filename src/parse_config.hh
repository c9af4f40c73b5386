#pragma once

#include "outcome.hh"

#include <string>
#include <string_view>
#include <vector>

namespace avroshard {

enum class ColumnType : uint8_t {
  numeric = 0,
  categorical = 1,
  string = 2,
  // all-null column
  bad = 3,
};

std::string_view column_type_name(ColumnType type);

// Everything a worker needs to parse any chunk of one file. Built once by
// preview, then shared read-only.
struct ParseConfiguration {
  // container preamble, replayed in front of every chunk
  std::string header;
  std::vector<std::string> column_names;
  std::vector<ColumnType> column_types;
  // one label list per column; empty unless categorical
  std::vector<std::vector<std::string>> domains;
  uint64_t recommended_block_size = 0;
};

Result<void> validate(const ParseConfiguration &config);

std::string serialize_config(const ParseConfiguration &config);
Result<ParseConfiguration> deserialize_config(std::string_view bytes);

Result<void> save_config(const ParseConfiguration &config,
                         const std::string &path);
Result<ParseConfiguration> load_config(const std::string &path);

}  // namespace avroshard
