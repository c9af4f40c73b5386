#pragma once

#include "outcome.hh"
#include "parse_writer.hh"
#include "schema.hh"

#include <avro/Generic.hh>

#include <span>

namespace avroshard {

// Emits `record` as one row, column i taken from `fields[i]`. Fails with
// configuration_invariant when a field does not exist in the record or holds
// a value of another kind; the row is then left unfinished.
Result<void> write_record(const avro::GenericRecord &record,
                          std::span<const FlatField> fields, ParseWriter &out);

}  // namespace avroshard
