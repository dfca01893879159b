#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/engine/query.hpp"
#include "internal/model/schema.hpp"
#include "internal/model/value.hpp"
#include "internal/record/record.hpp"
#include "internal/registry/model_registry.hpp"
#include "internal/storage/sequence.hpp"
#include "internal/storage/storage_backend.hpp"

namespace mapper::engine {

/*
  Immutable per-call scope. Passing one explicitly avoids depending on the
  engine's shared active namespace.
*/
struct ExecutionContext {
  std::string database;
};

/*
  DataEngine

  Single entry point composing registry + backend + active namespace.
  Every operation resolves the model's schema, validates and coerces its
  input, and only then calls the backend, so a rejected call never mutates
  the store.

      DataEngine engine(registry, std::make_shared<MemoryBackend>());
      engine.Use("blog_db");
      auto user = engine.Create("users", {{"name", std::string("Alice")}, {"age", std::int64_t{30}}});

  Concurrency: the registry and backend are safe to share. The active
  namespace is one value per engine; callers that switch namespaces
  concurrently must use the ExecutionContext overloads instead of Use().
*/
class DataEngine {
 public:
  static constexpr const char* kDefaultNamespace = "default";

  DataEngine(std::shared_ptr<registry::ModelRegistry> registry, storage::StorageBackendPtr backend,
             std::string default_namespace = kDefaultNamespace);

  // ------------------------------------------------------------
  // Namespace
  // ------------------------------------------------------------

  // Throws InvalidArgumentError for malformed names. Unknown namespaces
  // come into existence on first write.
  DataEngine& Use(const std::string& database);

  std::string ActiveNamespace() const;

  // Snapshot of the active namespace.
  ExecutionContext Context() const;

  // Validated context for an explicit namespace.
  static ExecutionContext ContextFor(const std::string& database);

  // ------------------------------------------------------------
  // CRUD
  // ------------------------------------------------------------

  record::Record Create(const std::string& model_name, const model::ValueMap& fields);
  record::Record Create(const ExecutionContext& ctx, const std::string& model_name, const model::ValueMap& fields);

  std::optional<record::Record> Get(const std::string& model_name, model::Identifier id);
  std::optional<record::Record> Get(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id);

  record::Record Update(const std::string& model_name, model::Identifier id, const model::ValueMap& fields);
  record::Record Update(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id, const model::ValueMap& fields);

  bool Delete(const std::string& model_name, model::Identifier id);
  bool Delete(const ExecutionContext& ctx, const std::string& model_name, model::Identifier id);

  // ------------------------------------------------------------
  // Query
  // ------------------------------------------------------------

  // Lazy and restartable; every pass re-runs the scan.
  storage::Sequence<record::Record> Query(const std::string& model_name, const Filter& filter = {}, const QueryOptions& options = {});
  storage::Sequence<record::Record> Query(const ExecutionContext& ctx, const std::string& model_name, const Filter& filter = {},
                                          const QueryOptions& options = {});

  std::size_t Count(const std::string& model_name, const Filter& filter = {});
  std::size_t Count(const ExecutionContext& ctx, const std::string& model_name, const Filter& filter = {});

  // ------------------------------------------------------------
  // Models
  // ------------------------------------------------------------

  // All-or-nothing; see ModelRegistry::Load.
  void Reload(const std::vector<model::ModelDefinition>& definitions);

  registry::ModelRegistry& Registry() {
    return *registry_;
  }

 private:
  // Throws DuplicateKeyError if another record in scope holds `value` in
  // `field`. `self` is excluded from the check.
  void CheckUnique(const storage::Scope& scope, const model::ModelSchema& schema, const model::Field& field, const model::Value& value,
                   std::optional<model::Identifier> self);

  std::shared_ptr<registry::ModelRegistry> registry_;
  storage::StorageBackendPtr               backend_;

  mutable std::mutex active_mutex_;
  std::string        active_;
};

} // namespace mapper::engine
