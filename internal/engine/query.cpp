#include "internal/engine/query.hpp"

#include <memory>

#include "internal/util/errors.hpp"

namespace mapper::engine {

namespace {

struct CompiledCondition {
  std::string               field;
  bool                      is_identifier = false;
  Op                        op            = Op::kEquals;
  std::vector<model::Value> operands;
};

bool Matches(const model::Value& actual, const CompiledCondition& c) {
  switch (c.op) {
    case Op::kEquals:
      return model::Equals(actual, c.operands.front());
    case Op::kNotEquals:
      return !model::Equals(actual, c.operands.front());
    case Op::kGreaterThan: {
      auto cmp = model::Compare(actual, c.operands.front());
      return cmp && *cmp > 0;
    }
    case Op::kLessThan: {
      auto cmp = model::Compare(actual, c.operands.front());
      return cmp && *cmp < 0;
    }
    case Op::kInSet:
      for (const auto& member : c.operands) {
        if (model::Equals(actual, member)) return true;
      }
      return false;
  }
  return false;
}

} // namespace

storage::Predicate CompileFilter(const model::ModelSchema& schema, const Filter& filter) {
  if (filter.empty()) {
    return {};
  }

  auto compiled = std::make_shared<std::vector<CompiledCondition>>();
  compiled->reserve(filter.size());

  for (const auto& condition : filter) {
    const auto* field = schema.Find(condition.field);
    if (!field) {
      throw util::UnknownFieldError("model '" + schema.Name() + "' has no field '" + condition.field + "' to filter on");
    }
    if (condition.op != Op::kInSet && condition.operands.size() != 1) {
      throw util::InvalidArgumentError("filter on model '" + schema.Name() + "' field '" + condition.field + "' with operator " +
                                       std::string(ToString(condition.op)) + " needs exactly one operand");
    }

    CompiledCondition c;
    c.field         = field->name;
    c.is_identifier = field->primary;
    c.op            = condition.op;
    c.operands.reserve(condition.operands.size());
    for (const auto& operand : condition.operands) {
      auto coerced = model::Coerce(operand, field->type);
      if (!coerced) {
        throw util::TypeMismatchError("filter on model '" + schema.Name() + "' field '" + field->name + "' expects " +
                                      std::string(model::ToString(field->type)) + ", got " + std::string(model::TypeName(operand)));
      }
      c.operands.push_back(std::move(*coerced));
    }
    compiled->push_back(std::move(c));
  }

  return [compiled](const storage::StoredRow& row) {
    for (const auto& c : *compiled) {
      model::Value actual;
      if (c.is_identifier) {
        actual = row.id;
      } else {
        const auto it = row.values.find(c.field);
        if (it != row.values.end()) actual = it->second;
      }
      if (!Matches(actual, c)) {
        return false;
      }
    }
    return true;
  };
}

} // namespace mapper::engine
