#include "row_writer.hh"

namespace avroshard {

namespace {

avro::Type value_type(FieldKind kind) {
  switch (kind) {
  case FieldKind::boolean:
    return avro::AVRO_BOOL;
  case FieldKind::int32:
    return avro::AVRO_INT;
  case FieldKind::int64:
    return avro::AVRO_LONG;
  case FieldKind::float32:
    return avro::AVRO_FLOAT;
  case FieldKind::float64:
    return avro::AVRO_DOUBLE;
  case FieldKind::string:
    return avro::AVRO_STRING;
  case FieldKind::bytes:
    return avro::AVRO_BYTES;
  case FieldKind::enumeration:
    return avro::AVRO_ENUM;
  case FieldKind::null:
    return avro::AVRO_NULL;
  }
  return avro::AVRO_UNKNOWN;
}

void write_value(ColumnIndex col, FieldKind kind,
                 const avro::GenericDatum &datum, ParseWriter &out) {
  switch (kind) {
  case FieldKind::null:
    out.add_invalid_cell(col);
    break;
  case FieldKind::boolean:
    out.add_numeric_cell(col, datum.value<bool>() ? 1 : 0, 0);
    break;
  case FieldKind::int32:
    out.add_numeric_cell(col, datum.value<int32_t>(), 0);
    break;
  case FieldKind::int64:
    out.add_numeric_cell(col, datum.value<int64_t>(), 0);
    break;
  case FieldKind::float32:
    out.add_numeric_cell(col, static_cast<double>(datum.value<float>()));
    break;
  case FieldKind::float64:
    out.add_numeric_cell(col, datum.value<double>());
    break;
  case FieldKind::string:
    out.add_string_cell(col, datum.value<std::string>());
    break;
  case FieldKind::bytes: {
    const auto &bytes = datum.value<std::vector<uint8_t>>();
    out.add_string_cell(
        col, std::string_view(reinterpret_cast<const char *>(  // NOLINT
                                  bytes.data()),
                              bytes.size()));
    break;
  }
  case FieldKind::enumeration:
    out.add_numeric_cell(
        col, static_cast<int64_t>(datum.value<avro::GenericEnum>().value()), 0);
    break;
  }
}

}  // namespace

Result<void> write_record(const avro::GenericRecord &record,
                          std::span<const FlatField> fields, ParseWriter &out) {
  for (std::size_t i = 0; i < fields.size(); i++) {
    const auto &field = fields[i];
    auto col = static_cast<ColumnIndex>(i);
    if (field.position >= record.fieldCount()) {
      return make_error(Errc::configuration_invariant,
                        fmt::format("field '{}' at {} but the record has {}",
                                    field.name, field.position,
                                    record.fieldCount()));
    }

    // unions report the type of the branch they hold
    const auto &datum = record.fieldAt(field.position);
    if (datum.type() == avro::AVRO_NULL) {
      out.add_invalid_cell(col);
      continue;
    }
    if (datum.type() != value_type(field.kind)) {
      return make_error(
          Errc::configuration_invariant,
          fmt::format("field '{}' holds avro type {} but reads as {}",
                      field.name, avro::toString(datum.type()),
                      field_kind_name(field.kind)));
    }
    write_value(col, field.kind, datum, out);
  }
  out.end_row();
  return outcome::success();
}

}  // namespace avroshard
