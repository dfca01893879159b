#include "internal/engine/data_engine.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/name_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mapper::engine {

using observability::IntField;
using observability::StringField;

namespace {

std::string Describe(const model::ModelSchema& schema, const model::Field& field) {
  return "model '" + schema.Name() + "' field '" + field.name + "'";
}

std::string Describe(const model::ModelSchema& schema, model::Identifier id) {
  return "model '" + schema.Name() + "' record " + std::to_string(id.value);
}

// Coerces `value` to the field's type or throws TypeMismatchError.
model::Value CheckValue(const model::ModelSchema& schema, const model::Field& field, const model::Value& value) {
  if (model::IsNull(value)) {
    if (!field.nullable) {
      throw util::TypeMismatchError(Describe(schema, field) + " is not nullable");
    }
    return value;
  }

  auto coerced = model::Coerce(value, field.type);
  if (!coerced) {
    throw util::TypeMismatchError(Describe(schema, field) + " expects " + std::string(model::ToString(field.type)) + ", got " +
                                  std::string(model::TypeName(value)));
  }
  return std::move(*coerced);
}

const model::Field& RequireField(const model::ModelSchema& schema, const std::string& name) {
  const auto* field = schema.Find(name);
  if (!field) {
    throw util::UnknownFieldError("model '" + schema.Name() + "' has no field '" + name + "'");
  }
  return *field;
}

// Full record view of stored values under the current schema. The
// identifier comes from the key. A value the store lacks, or one that no
// longer fits its field after a reload, reads as the field's default or
// null; StorageError when the field allows neither.
record::Record Wrap(const model::ModelSchema& schema, model::Identifier id, const model::ValueMap& stored) {
  model::ValueMap values;
  for (const auto& field : schema.Fields()) {
    if (field.primary) {
      values.emplace(field.name, id);
      continue;
    }

    std::optional<model::Value> value;
    const auto                  it = stored.find(field.name);
    if (it != stored.end()) {
      value = model::Coerce(it->second, field.type);
      if (value && model::IsNull(*value) && !field.nullable) {
        value.reset();
      }
      if (!value) {
        MAPPER_LOG_WARN("Stored value does not fit schema", {StringField("model", schema.Name()), StringField("field", field.name),
                                                             IntField("id", static_cast<std::int64_t>(id.value)),
                                                             StringField("stored_type", std::string(model::TypeName(it->second)))});
      }
    }

    if (!value) {
      if (field.default_value) {
        value = *field.default_value;
      } else if (field.nullable) {
        value = model::Value{model::Null{}};
      } else {
        throw util::StorageError(Describe(schema, id) + ": stored value for field '" + field.name + "' does not fit type " +
                                 std::string(model::ToString(field.type)) + " and the field has no default");
      }
    }
    values.emplace(field.name, std::move(*value));
  }
  return record::Record(schema.Name(), id, std::move(values));
}

// Ascending order with nulls first.
bool ValueLess(const model::Value& a, const model::Value& b) {
  if (model::IsNull(a) || model::IsNull(b)) {
    return model::IsNull(a) && !model::IsNull(b);
  }
  auto cmp = model::Compare(a, b);
  return cmp && *cmp < 0;
}

} // namespace

DataEngine::DataEngine(std::shared_ptr<registry::ModelRegistry> registry, storage::StorageBackendPtr backend, std::string default_namespace)
    : registry_(std::move(registry)), backend_(std::move(backend)), active_(std::move(default_namespace)) {
  if (!registry_ || !backend_) {
    throw util::InvalidArgumentError("data engine needs a registry and a storage backend");
  }
  storage::common::ValidateNamespaceName(active_);
}

// ------------------------------------------------------------
// Namespace
// ------------------------------------------------------------

DataEngine& DataEngine::Use(const std::string& database) {
  storage::common::ValidateNamespaceName(database);
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = database;
  }
  MAPPER_LOG_DEBUG("Switched namespace", {StringField("namespace", database)});
  return *this;
}

std::string DataEngine::ActiveNamespace() const {
  std::lock_guard<std::mutex> lock(active_mutex_);
  return active_;
}

ExecutionContext DataEngine::Context() const {
  return ExecutionContext{ActiveNamespace()};
}

ExecutionContext DataEngine::ContextFor(const std::string& database) {
  storage::common::ValidateNamespaceName(database);
  return ExecutionContext{database};
}

// ------------------------------------------------------------
// Uniqueness
// ------------------------------------------------------------

void DataEngine::CheckUnique(const storage::Scope& scope, const model::ModelSchema& schema, const model::Field& field,
                             const model::Value& value, std::optional<model::Identifier> self) {
  if (model::IsNull(value)) {
    return;
  }

  const auto name = field.name;
  auto       rows = backend_->Scan(scope, [name, value, self](const storage::StoredRow& row) {
    if (self && row.id == *self) return false;
    const auto it = row.values.find(name);
    return it != row.values.end() && model::Equals(it->second, value);
  });

  auto cursor = rows.Open();
  if (cursor && cursor->Next()) {
    MAPPER_LOG_WARN("Uniqueness violation",
                    {StringField("namespace", scope.database), StringField("model", schema.Name()), StringField("field", field.name)});
    throw util::DuplicateKeyError(Describe(schema, field) + " already holds " + model::ToString(value) + " in '" + scope.database + "'");
  }
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

record::Record DataEngine::Create(const std::string& model_name, const model::ValueMap& fields) {
  return Create(Context(), model_name, fields);
}

record::Record DataEngine::Create(const ExecutionContext& ctx, const std::string& model_name, const model::ValueMap& fields) {
  const auto schema = registry_->Resolve(model_name);

  for (const auto& [name, _] : fields) {
    RequireField(*schema, name);
  }

  std::optional<model::Identifier> requested;
  model::ValueMap                  values;
  const auto                       now = util::Now();

  for (const auto& field : schema->Fields()) {
    const auto supplied = fields.find(field.name);

    if (field.primary) {
      if (supplied != fields.end() && !model::IsNull(supplied->second)) {
        requested = std::get<model::Identifier>(CheckValue(*schema, field, supplied->second));
      }
      continue;
    }

    if (field.managed) {
      if (supplied != fields.end()) {
        throw util::InvalidArgumentError(Describe(*schema, field) + " is managed by the engine");
      }
      values.emplace(field.name, model::Value{now});
      continue;
    }

    if (supplied != fields.end()) {
      values.emplace(field.name, CheckValue(*schema, field, supplied->second));
    } else if (field.default_value) {
      values.emplace(field.name, *field.default_value);
    } else if (field.nullable) {
      values.emplace(field.name, model::Null{});
    } else {
      throw util::MissingFieldError(Describe(*schema, field) + " is required and has no default");
    }
  }

  const storage::Scope scope{ctx.database, schema->Name()};
  for (const auto* field : schema->UniqueFields()) {
    CheckUnique(scope, *schema, *field, values.at(field->name), std::nullopt);
  }

  const auto id = backend_->Insert(scope, values, requested);

  MAPPER_LOG_DEBUG("Created record",
                   {StringField("namespace", ctx.database), StringField("model", schema->Name()), IntField("id", static_cast<std::int64_t>(id.value))});
  return Wrap(*schema, id, values);
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<record::Record> DataEngine::Get(const std::string& model_name, model::Identifier id) {
  return Get(Context(), model_name, id);
}

std::optional<record::Record> DataEngine::Get(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id) {
  const auto schema = registry_->Resolve(model_name);
  auto       stored = backend_->Fetch(storage::Scope{ctx.database, schema->Name()}, id);
  if (!stored) {
    return std::nullopt;
  }
  return Wrap(*schema, id, *stored);
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

record::Record DataEngine::Update(const std::string& model_name, model::Identifier id, const model::ValueMap& fields) {
  return Update(Context(), model_name, id, fields);
}

record::Record DataEngine::Update(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id, const model::ValueMap& fields) {
  const auto           schema = registry_->Resolve(model_name);
  const storage::Scope scope{ctx.database, schema->Name()};

  model::ValueMap partial;
  for (const auto& [name, value] : fields) {
    const auto& field = RequireField(*schema, name);
    if (field.primary) {
      const auto requested = CheckValue(*schema, field, value);
      if (!model::Equals(requested, model::Value{id})) {
        throw util::InvalidArgumentError(Describe(*schema, id) + ": identifier field '" + field.name + "' cannot be changed");
      }
      continue;
    }
    if (field.managed) {
      throw util::InvalidArgumentError(Describe(*schema, field) + " is managed by the engine");
    }
    partial.emplace(name, CheckValue(*schema, field, value));
  }

  auto current = backend_->Fetch(scope, id);
  if (!current) {
    throw util::NotFoundError(Describe(*schema, id) + " does not exist in '" + ctx.database + "'");
  }

  if (partial.empty()) {
    return Wrap(*schema, id, *current);
  }
  if (schema->Timestamps()) {
    partial[std::string(model::ModelSchema::kUpdateTimeField)] = model::Value{util::Now()};
  }

  for (const auto* field : schema->UniqueFields()) {
    const auto next = partial.find(field->name);
    if (next == partial.end()) {
      continue;
    }
    const auto prev = current->find(field->name);
    if (prev != current->end() && model::Equals(prev->second, next->second)) {
      continue;
    }
    CheckUnique(scope, *schema, *field, next->second, id);
  }

  auto merged = backend_->Update(scope, id, partial);

  MAPPER_LOG_DEBUG("Updated record",
                   {StringField("namespace", ctx.database), StringField("model", schema->Name()), IntField("id", static_cast<std::int64_t>(id.value)),
                    IntField("fields", static_cast<std::int64_t>(partial.size()))});
  return Wrap(*schema, id, merged);
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

bool DataEngine::Delete(const std::string& model_name, model::Identifier id) {
  return Delete(Context(), model_name, id);
}

bool DataEngine::Delete(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id) {
  const auto schema  = registry_->Resolve(model_name);
  const bool removed = backend_->Delete(storage::Scope{ctx.database, schema->Name()}, id);

  MAPPER_LOG_DEBUG("Deleted record", {StringField("namespace", ctx.database), StringField("model", schema->Name()),
                                      IntField("id", static_cast<std::int64_t>(id.value)), observability::BoolField("removed", removed)});
  return removed;
}

// ------------------------------------------------------------
// Query
// ------------------------------------------------------------

storage::Sequence<record::Record> DataEngine::Query(const std::string& model_name, const Filter& filter, const QueryOptions& options) {
  return Query(Context(), model_name, filter, options);
}

storage::Sequence<record::Record> DataEngine::Query(const ExecutionContext& ctx, const std::string& model_name, const Filter& filter,
                                                    const QueryOptions& options) {
  const model::ModelSchemaPtr schema    = registry_->Resolve(model_name);
  auto                        predicate = CompileFilter(*schema, filter);

  auto rows    = backend_->Scan(storage::Scope{ctx.database, schema->Name()}, std::move(predicate));
  auto records = rows.Map([schema](storage::StoredRow row) { return Wrap(*schema, row.id, row.values); });

  if (options.order_by) {
    const auto key        = RequireField(*schema, *options.order_by).name;
    const bool descending = options.descending;
    auto       unsorted   = records;

    records = storage::Sequence<record::Record>([unsorted, key, descending]() {
      auto items = unsorted.ToVector();
      std::stable_sort(items.begin(), items.end(), [&key, descending](const record::Record& a, const record::Record& b) {
        return descending ? ValueLess(b.Get(key), a.Get(key)) : ValueLess(a.Get(key), b.Get(key));
      });
      return storage::Sequence<record::Record>::FromVector(std::move(items)).Open();
    });
  }

  if (options.offset > 0 || options.limit) {
    records = records.Slice(options.offset, options.limit);
  }
  return records;
}

std::size_t DataEngine::Count(const std::string& model_name, const Filter& filter) {
  return Count(Context(), model_name, filter);
}

std::size_t DataEngine::Count(const ExecutionContext& ctx, const std::string& model_name, const Filter& filter) {
  std::size_t n      = 0;
  auto        cursor = Query(ctx, model_name, filter).Open();
  while (cursor && cursor->Next()) {
    ++n;
  }
  return n;
}

// ------------------------------------------------------------
// Models
// ------------------------------------------------------------

void DataEngine::Reload(const std::vector<model::ModelDefinition>& definitions) {
  registry_->Load(definitions);
}

} // namespace mapper::engine
