#include "internal/model/schema.hpp"

#include <unordered_set>

#include "internal/util/errors.hpp"

namespace mapper::model {

namespace {

std::string Where(const std::string& model, const std::string& field) {
  return "model '" + model + "' field '" + field + "'";
}

Field BuildField(const std::string& model, const FieldDefinition& def) {
  if (def.name.empty()) {
    throw util::SchemaError("model '" + model + "' declares a field with an empty name");
  }

  auto type = ParseFieldType(def.type);
  if (!type) {
    throw util::SchemaError(Where(model, def.name) + " has unsupported type '" + def.type + "'");
  }

  Field field;
  field.name     = def.name;
  field.type     = *type;
  field.nullable = def.nullable;
  field.unique   = def.unique;
  field.primary  = def.primary;

  if (def.default_value) {
    if (IsNull(*def.default_value)) {
      if (!def.nullable) {
        throw util::SchemaError(Where(model, def.name) + " is not nullable but declares a null default");
      }
      field.default_value = Value{Null{}};
    } else {
      auto coerced = Coerce(*def.default_value, *type);
      if (!coerced) {
        throw util::SchemaError(Where(model, def.name) + " default of type " + std::string(TypeName(*def.default_value)) +
                                " does not match declared type " + std::string(ToString(*type)));
      }
      field.default_value = std::move(*coerced);
    }
  }
  return field;
}

Field ManagedTimestamp(std::string_view name) {
  Field field;
  field.name     = std::string(name);
  field.type     = FieldType::kTimestamp;
  field.nullable = true;
  field.managed  = true;
  return field;
}

void MakePrimary(const std::string& model, Field& field) {
  if (field.type != FieldType::kIdentifier) {
    throw util::SchemaError(Where(model, field.name) + " cannot be the identifier: type is " + std::string(ToString(field.type)) +
                            ", expected identifier");
  }
  if (field.default_value) {
    throw util::SchemaError(Where(model, field.name) + " is the identifier and cannot declare a default");
  }
  field.primary  = true;
  field.unique   = true;
  field.nullable = false;
}

} // namespace

bool operator==(const Field& a, const Field& b) {
  if (a.name != b.name || a.type != b.type || a.nullable != b.nullable || a.unique != b.unique || a.primary != b.primary ||
      a.managed != b.managed) {
    return false;
  }
  if (a.default_value.has_value() != b.default_value.has_value()) {
    return false;
  }
  return !a.default_value || Equals(*a.default_value, *b.default_value);
}

ModelSchema::ModelSchema(std::string name, std::vector<Field> fields, std::size_t identifier_index, bool timestamps)
    : name_(std::move(name)), fields_(std::move(fields)), identifier_index_(identifier_index), timestamps_(timestamps) {
}

std::shared_ptr<const ModelSchema> ModelSchema::Build(const ModelDefinition& definition) {
  const auto& model = definition.name;
  if (model.empty()) {
    throw util::SchemaError("model definition has an empty name");
  }
  if (definition.fields.empty()) {
    throw util::SchemaError("model '" + model + "' declares no fields");
  }

  std::vector<Field>              fields;
  std::unordered_set<std::string> seen;
  std::optional<std::size_t>      primary;

  fields.reserve(definition.fields.size() + 3);
  for (const auto& def : definition.fields) {
    if (!seen.insert(def.name).second) {
      throw util::SchemaError(Where(model, def.name) + " is declared more than once");
    }
    fields.push_back(BuildField(model, def));
    if (def.primary) {
      if (primary) {
        throw util::SchemaError("model '" + model + "' declares more than one identifier field ('" + fields[*primary].name + "', '" +
                                def.name + "')");
      }
      primary = fields.size() - 1;
    }
  }

  if (!primary) {
    const std::string id_name(kDefaultIdentifierField);
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (fields[i].name == id_name) {
        primary = i;
        break;
      }
    }
    if (!primary) {
      Field id;
      id.name = id_name;
      id.type = FieldType::kIdentifier;
      fields.insert(fields.begin(), std::move(id));
      primary = 0;
    }
  }

  MakePrimary(model, fields[*primary]);

  if (definition.timestamps) {
    for (const auto name : {kCreateTimeField, kUpdateTimeField}) {
      if (seen.count(std::string(name)) != 0) {
        throw util::SchemaError(Where(model, std::string(name)) + " is reserved for managed timestamps");
      }
      fields.push_back(ManagedTimestamp(name));
    }
  }

  return std::shared_ptr<const ModelSchema>(new ModelSchema(model, std::move(fields), *primary, definition.timestamps));
}

const Field* ModelSchema::Find(std::string_view field_name) const {
  for (const auto& field : fields_) {
    if (field.name == field_name) {
      return &field;
    }
  }
  return nullptr;
}

std::vector<const Field*> ModelSchema::UniqueFields() const {
  std::vector<const Field*> out;
  for (const auto& field : fields_) {
    if (field.unique && !field.primary) {
      out.push_back(&field);
    }
  }
  return out;
}

ModelDefinition ModelSchema::ToDefinition() const {
  ModelDefinition def;
  def.name       = name_;
  def.timestamps = timestamps_;
  def.fields.reserve(fields_.size());
  for (const auto& field : fields_) {
    if (field.managed) {
      continue;
    }
    FieldDefinition f;
    f.name          = field.name;
    f.type          = std::string(ToString(field.type));
    f.nullable      = field.nullable;
    f.default_value = field.default_value;
    f.unique        = field.unique;
    f.primary       = field.primary;
    def.fields.push_back(std::move(f));
  }
  return def;
}

bool ModelSchema::operator==(const ModelSchema& other) const {
  return name_ == other.name_ && fields_ == other.fields_ && identifier_index_ == other.identifier_index_ &&
         timestamps_ == other.timestamps_;
}

} // namespace mapper::model
