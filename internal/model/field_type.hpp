#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mapper::model {

enum class FieldType : std::uint8_t {
  kInteger    = 1,
  kFloat      = 2,
  kText       = 3,
  kBoolean    = 4,
  kTimestamp  = 5,
  kIdentifier = 6,
};

constexpr std::string_view ToString(FieldType type) {
  switch (type) {
    case FieldType::kInteger:
      return "integer";
    case FieldType::kFloat:
      return "float";
    case FieldType::kText:
      return "text";
    case FieldType::kBoolean:
      return "boolean";
    case FieldType::kTimestamp:
      return "timestamp";
    case FieldType::kIdentifier:
    default:
      return "identifier";
  }
}

// Case-insensitive; accepts the common aliases (int, string, bool, ...).
std::optional<FieldType> ParseFieldType(std::string_view tag);

} // namespace mapper::model
