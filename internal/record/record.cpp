#include "internal/record/record.hpp"

#include <sstream>

namespace mapper::record {

Record::Record(std::string model, model::Identifier id, model::ValueMap values)
    : model_(std::move(model)), id_(id), values_(std::move(values)) {
}

std::string Record::Describe(std::string_view field) const {
  return "model '" + model_ + "' record " + std::to_string(id_.value) + " field '" + std::string(field) + "'";
}

bool Record::Has(std::string_view field) const {
  return values_.find(std::string(field)) != values_.end();
}

bool Record::IsNull(std::string_view field) const {
  return model::IsNull(Get(field));
}

const model::Value& Record::Get(std::string_view field) const {
  const auto it = values_.find(std::string(field));
  if (it == values_.end()) {
    throw util::UnknownFieldError(Describe(field) + " does not exist");
  }
  return it->second;
}

std::string Record::ToString() const {
  std::ostringstream out;
  out << model_ << '#' << id_.value << '{';
  bool first = true;
  for (const auto& [name, value] : values_) {
    if (!first) out << ", ";
    first = false;
    out << name << '=' << model::ToString(value);
  }
  out << '}';
  return out.str();
}

bool Record::operator==(const Record& other) const {
  if (model_ != other.model_ || !(id_ == other.id_) || values_.size() != other.values_.size()) {
    return false;
  }
  auto a = values_.begin();
  auto b = other.values_.begin();
  for (; a != values_.end(); ++a, ++b) {
    if (a->first != b->first || a->second.index() != b->second.index() || !model::Equals(a->second, b->second)) {
      return false;
    }
  }
  return true;
}

} // namespace mapper::record
