#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "internal/model/field_type.hpp"
#include "internal/util/time.hpp"

namespace mapper::model {

/*
  Record identifier. Kept distinct from plain integers so a value map
  always says which fields are keys.
*/
struct Identifier {
  std::uint64_t value = 0;

  friend bool operator==(Identifier a, Identifier b) {
    return a.value == b.value;
  }
  friend bool operator<(Identifier a, Identifier b) {
    return a.value < b.value;
  }
};

using Null = std::monostate;

using Value = std::variant<Null, std::int64_t, double, std::string, bool, util::TimePoint, Identifier>;

// Ordered so that iteration, printing and serialization are deterministic.
using ValueMap = std::map<std::string, Value>;

inline bool IsNull(const Value& value) {
  return std::holds_alternative<Null>(value);
}

// Name of the type held by the value ("null", "integer", ...).
std::string_view TypeName(const Value& value);

// Returns the value converted to `type`, or nullopt when the value cannot
// represent it. Null is returned unchanged. Applied conversions:
//   integer -> float, non-negative integer -> identifier,
//   ISO-8601 text -> timestamp; timestamps are truncated to microseconds.
// NaN is never a valid float.
std::optional<Value> Coerce(const Value& value, FieldType type);

// Parses user-supplied text ("42", "true", "2024-01-01T00:00:00Z") into a
// value of `type`. "null" and "~" map to null.
std::optional<Value> ParseValue(const std::string& text, FieldType type);

// Three-way comparison for values of the same kind; integers and floats
// compare numerically. Returns nullopt for incomparable pairs (including
// any null or NaN operand).
std::optional<int> Compare(const Value& a, const Value& b);

// Equality with numeric widening; null equals only null.
bool Equals(const Value& a, const Value& b);

// Human readable rendering: text is quoted, null prints as "null".
std::string ToString(const Value& value);

} // namespace mapper::model
