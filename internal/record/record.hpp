#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/model/value.hpp"
#include "internal/util/errors.hpp"

namespace mapper::record {

/*
  Typed instance of a model, returned by the engine.

  Holds every schema field (nulls included) by value; the caller owns it
  and nothing in the engine or backend refers back to it.

      auto user = engine.Create("users", {{"name", std::string("Alice")}});
      auto name = user.Get<std::string>("name");
      auto age  = user.GetOptional<std::int64_t>("age");
*/
class Record {
 public:
  Record(std::string model, model::Identifier id, model::ValueMap values);

  const std::string& Model() const {
    return model_;
  }

  model::Identifier Id() const {
    return id_;
  }

  const model::ValueMap& Values() const {
    return values_;
  }

  bool Has(std::string_view field) const;

  // Throws UnknownFieldError.
  bool IsNull(std::string_view field) const;

  // Throws UnknownFieldError.
  const model::Value& Get(std::string_view field) const;

  // Throws UnknownFieldError, or TypeMismatchError when the field is null
  // or holds another type.
  template <typename T>
  T Get(std::string_view field) const {
    const auto& value = Get(field);
    if (const auto* v = std::get_if<T>(&value)) {
      return *v;
    }
    throw util::TypeMismatchError(Describe(field) + " holds " + std::string(model::TypeName(value)) + ", not the requested type");
  }

  // nullopt when the field is null.
  template <typename T>
  std::optional<T> GetOptional(std::string_view field) const {
    const auto& value = Get(field);
    if (model::IsNull(value)) {
      return std::nullopt;
    }
    return Get<T>(field);
  }

  // users#1{age=30, name="Alice"}
  std::string ToString() const;

  bool operator==(const Record& other) const;
  bool operator!=(const Record& other) const {
    return !(*this == other);
  }

 private:
  std::string Describe(std::string_view field) const;

  std::string       model_;
  model::Identifier id_;
  model::ValueMap   values_;
};

} // namespace mapper::record
