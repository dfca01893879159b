#include "internal/storage/common/record_codec.hpp"

#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mapper::storage {

using mapper::storage::v1::FieldValue;
using mapper::storage::v1::StoredRecord;

FieldValue ToProto(const model::Value& value) {
  FieldValue out;
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, model::Null>) {
          out.set_null_value(true);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          out.set_integer_value(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out.set_float_value(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out.set_text_value(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          out.set_boolean_value(v);
        } else if constexpr (std::is_same_v<T, util::TimePoint>) {
          out.set_timestamp_micros(util::ToUnixMicros(v));
        } else {
          out.set_identifier_value(v.value);
        }
      },
      value);
  return out;
}

model::Value FromProto(const FieldValue& value) {
  switch (value.kind_case()) {
    case FieldValue::kIntegerValue:
      return value.integer_value();
    case FieldValue::kFloatValue:
      return value.float_value();
    case FieldValue::kTextValue:
      return value.text_value();
    case FieldValue::kBooleanValue:
      return value.boolean_value();
    case FieldValue::kTimestampMicros:
      return util::FromUnixMicros(value.timestamp_micros());
    case FieldValue::kIdentifierValue:
      return model::Identifier{value.identifier_value()};
    case FieldValue::kNullValue:
    case FieldValue::KIND_NOT_SET:
    default:
      return model::Null{};
  }
}

std::string EncodeRecord(const model::ValueMap& values) {
  StoredRecord record;
  auto&        fields = *record.mutable_fields();
  for (const auto& [name, value] : values) {
    fields[name] = ToProto(value);
  }

  std::string bytes;
  if (!record.SerializeToString(&bytes)) {
    throw util::StorageError("failed to serialize record");
  }
  return bytes;
}

model::ValueMap DecodeRecord(const std::string& bytes) {
  StoredRecord record;
  if (!record.ParseFromString(bytes)) {
    throw util::StorageError("stored record is corrupt");
  }

  model::ValueMap values;
  for (const auto& [name, value] : record.fields()) {
    values.emplace(name, FromProto(value));
  }
  return values;
}

} // namespace mapper::storage
