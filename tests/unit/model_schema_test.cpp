#include "internal/model/schema.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using mapper::model::FieldDefinition;
using mapper::model::FieldType;
using mapper::model::ModelDefinition;
using mapper::model::ModelSchema;
using mapper::model::Null;
using mapper::model::Value;
using mapper::util::SchemaError;

FieldDefinition MakeField(std::string name, std::string type) {
  FieldDefinition field;
  field.name = std::move(name);
  field.type = std::move(type);
  return field;
}

bool ThrowsSchemaError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const SchemaError&) {
    return true;
  }
  return false;
}

void TestImplicitIdentifierIsPrepended() {
  ModelDefinition def{"users", {MakeField("name", "text"), MakeField("age", "integer")}};
  auto            schema = ModelSchema::Build(def);

  assert(schema->Name() == "users");
  assert(schema->Fields().size() == 3);
  assert(schema->Fields()[0].name == "id");
  assert(schema->IdentifierField().name == "id");
  assert(schema->IdentifierField().type == FieldType::kIdentifier);
  assert(schema->IdentifierField().unique);
  assert(!schema->IdentifierField().nullable);
}

void TestDeclaredIdFieldIsUsed() {
  ModelDefinition def{"posts", {MakeField("title", "text"), MakeField("id", "identifier")}};
  auto            schema = ModelSchema::Build(def);

  assert(schema->Fields().size() == 2);
  assert(schema->IdentifierField().name == "id");
  assert(schema->Fields()[1].primary);
}

void TestExplicitPrimaryField() {
  auto key    = MakeField("post_id", "identifier");
  key.primary = true;
  ModelDefinition def{"posts", {key, MakeField("title", "text")}};
  auto            schema = ModelSchema::Build(def);

  assert(schema->IdentifierField().name == "post_id");
  assert(schema->Find("id") == nullptr);
  assert(schema->UniqueFields().empty());
}

void TestUniqueFieldsExcludeIdentifier() {
  auto email   = MakeField("email", "text");
  email.unique = true;
  ModelDefinition def{"users", {email, MakeField("name", "text")}};
  auto            schema = ModelSchema::Build(def);

  auto unique = schema->UniqueFields();
  assert(unique.size() == 1);
  assert(unique[0]->name == "email");
}

void TestDefaultsAreCoerced() {
  auto score          = MakeField("score", "float");
  score.default_value = Value{std::int64_t{1}};
  auto note           = MakeField("note", "text");
  note.nullable       = true;
  note.default_value  = Value{Null{}};

  auto schema = ModelSchema::Build(ModelDefinition{"games", {score, note}});
  assert(std::get<double>(*schema->Find("score")->default_value) == 1.0);
  assert(mapper::model::IsNull(*schema->Find("note")->default_value));
}

void TestInvalidDefinitionsAreRejected() {
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"", {MakeField("a", "text")}}); }));
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"empty", {}}); }));
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"m", {MakeField("", "text")}}); }));
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"m", {MakeField("a", "text"), MakeField("a", "integer")}}); }));
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"m", {MakeField("a", "blob")}}); }));
  assert(ThrowsSchemaError([] { ModelSchema::Build(ModelDefinition{"m", {MakeField("id", "text")}}); }));

  assert(ThrowsSchemaError([] {
    auto a          = MakeField("a", "integer");
    a.default_value = Value{std::string("x")};
    ModelSchema::Build(ModelDefinition{"m", {a}});
  }));

  assert(ThrowsSchemaError([] {
    auto a          = MakeField("a", "integer");
    a.default_value = Value{Null{}};
    ModelSchema::Build(ModelDefinition{"m", {a}});
  }));

  assert(ThrowsSchemaError([] {
    auto a    = MakeField("a", "identifier");
    auto b    = MakeField("b", "identifier");
    a.primary = true;
    b.primary = true;
    ModelSchema::Build(ModelDefinition{"m", {a, b}});
  }));

  assert(ThrowsSchemaError([] {
    auto a    = MakeField("a", "integer");
    a.primary = true;
    ModelSchema::Build(ModelDefinition{"m", {a}});
  }));
}

void TestErrorNamesModelAndField() {
  try {
    ModelSchema::Build(ModelDefinition{"users", {MakeField("age", "decimal")}});
    assert(false && "unsupported type must be rejected");
  } catch (const SchemaError& e) {
    const std::string msg = e.what();
    assert(msg.find("users") != std::string::npos);
    assert(msg.find("age") != std::string::npos);
  }
}

void TestToDefinitionRebuildsEqualSchema() {
  auto email   = MakeField("email", "string");
  email.unique = true;
  auto schema  = ModelSchema::Build(ModelDefinition{"users", {email, MakeField("age", "int")}});
  auto rebuilt = ModelSchema::Build(schema->ToDefinition());
  assert(*schema == *rebuilt);
}

void TestManagedTimestampFields() {
  ModelDefinition def{"users", {MakeField("name", "text")}};
  def.timestamps = true;
  auto schema    = ModelSchema::Build(def);

  assert(schema->Timestamps());
  assert(schema->Fields().size() == 4);
  const auto* created = schema->Find("create_time");
  const auto* updated = schema->Find("update_time");
  assert(created && updated);
  assert(created->type == FieldType::kTimestamp);
  assert(created->managed && updated->managed);
  assert(created->nullable);
  assert(!schema->Find("name")->managed);

  auto rebuilt = ModelSchema::Build(schema->ToDefinition());
  assert(*schema == *rebuilt);
  assert(schema->ToDefinition().fields.size() == 2);

  assert(ThrowsSchemaError([] {
    ModelDefinition clash{"users", {MakeField("create_time", "timestamp")}};
    clash.timestamps = true;
    ModelSchema::Build(clash);
  }));

  // Without the flag the names are ordinary fields.
  auto plain = ModelSchema::Build(ModelDefinition{"users", {MakeField("create_time", "timestamp")}});
  assert(!plain->Timestamps());
  assert(!plain->Find("create_time")->managed);
}

} // namespace

int main() {
  TestImplicitIdentifierIsPrepended();
  TestDeclaredIdFieldIsUsed();
  TestExplicitPrimaryField();
  TestUniqueFieldsExcludeIdentifier();
  TestDefaultsAreCoerced();
  TestInvalidDefinitionsAreRejected();
  TestErrorNamesModelAndField();
  TestToDefinitionRebuildsEqualSchema();
  TestManagedTimestampFields();

  std::cout << "mapper_unit_model_schema: pass\n";
  return 0;
}
