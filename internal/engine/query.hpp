#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/schema.hpp"
#include "internal/model/value.hpp"
#include "internal/storage/storage_backend.hpp"

namespace mapper::engine {

enum class Op : std::uint8_t {
  kEquals      = 1,
  kNotEquals   = 2,
  kGreaterThan = 3,
  kLessThan    = 4,
  kInSet       = 5,
};

constexpr std::string_view ToString(Op op) {
  switch (op) {
    case Op::kEquals:
      return "equals";
    case Op::kNotEquals:
      return "not-equals";
    case Op::kGreaterThan:
      return "greater-than";
    case Op::kLessThan:
      return "less-than";
    case Op::kInSet:
    default:
      return "in-set";
  }
}

/*
  One filter term. `operands` holds exactly one value, except for kInSet
  where it holds the set members.
*/
struct Condition {
  std::string               field;
  Op                        op = Op::kEquals;
  std::vector<model::Value> operands;
};

// Conjunction of conditions; empty matches everything.
using Filter = std::vector<Condition>;

inline Condition Where(std::string field, Op op, model::Value operand) {
  return Condition{std::move(field), op, {std::move(operand)}};
}

inline Condition WhereIn(std::string field, std::vector<model::Value> members) {
  return Condition{std::move(field), Op::kInSet, std::move(members)};
}

struct QueryOptions {
  std::optional<std::string> order_by;
  bool                       descending = false;
  std::size_t                offset     = 0;
  std::optional<std::size_t> limit;
};

/*
  Validates `filter` against `schema` and turns it into a backend predicate.

  Operands are coerced to the field type. Throws UnknownFieldError for
  fields not in the schema, TypeMismatchError for operands that do not fit,
  InvalidArgumentError for malformed conditions.

  Null semantics: equals/not-equals/in-set treat null as an ordinary value;
  greater-than and less-than never match a null field.
*/
storage::Predicate CompileFilter(const model::ModelSchema& schema, const Filter& filter);

} // namespace mapper::engine
