#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/field_type.hpp"
#include "internal/model/value.hpp"

namespace mapper::model {

/*
  Raw model definitions, as produced by a discovery collaborator.

  Nothing here is validated; ModelSchema::Build turns a definition into a
  schema or rejects it with SchemaError.
*/

struct FieldDefinition {
  std::string          name;
  std::string          type; // type tag, e.g. "integer", "text"
  bool                 nullable = false;
  std::optional<Value> default_value;
  bool                 unique  = false;
  bool                 primary = false;
};

struct ModelDefinition {
  std::string                  name;
  std::vector<FieldDefinition> fields;
  // Adds engine-managed create_time / update_time fields.
  bool timestamps = false;
};

struct Field {
  std::string          name;
  FieldType            type     = FieldType::kText;
  bool                 nullable = false;
  std::optional<Value> default_value;
  bool                 unique  = false;
  bool                 primary = false;
  // Set by the engine, never by callers.
  bool managed = false;
};

bool operator==(const Field& a, const Field& b);

/*
  Immutable description of one model.

  Invariants:
    - field names are unique
    - exactly one field is primary; it has type identifier, is unique,
      non-nullable and has no default
    - every default satisfies its field's type and nullability
    - with timestamps enabled, create_time and update_time are nullable
      managed timestamp fields; rows written before they were enabled
      read them as null
*/
class ModelSchema {
 public:
  // Name of the identifier field added when a definition declares none.
  static constexpr std::string_view kDefaultIdentifierField = "id";

  static constexpr std::string_view kCreateTimeField = "create_time";
  static constexpr std::string_view kUpdateTimeField = "update_time";

  static std::shared_ptr<const ModelSchema> Build(const ModelDefinition& definition);

  const std::string& Name() const {
    return name_;
  }

  const std::vector<Field>& Fields() const {
    return fields_;
  }

  const Field* Find(std::string_view field_name) const;

  const Field& IdentifierField() const {
    return fields_[identifier_index_];
  }

  std::vector<const Field*> UniqueFields() const;

  bool Timestamps() const {
    return timestamps_;
  }

  // Converts back into a definition that builds an equal schema.
  ModelDefinition ToDefinition() const;

  bool operator==(const ModelSchema& other) const;

 private:
  ModelSchema(std::string name, std::vector<Field> fields, std::size_t identifier_index, bool timestamps);

  std::string        name_;
  std::vector<Field> fields_;
  std::size_t        identifier_index_ = 0;
  bool               timestamps_       = false;
};

using ModelSchemaPtr = std::shared_ptr<const ModelSchema>;

} // namespace mapper::model
