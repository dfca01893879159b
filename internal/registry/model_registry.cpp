#include "internal/registry/model_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mapper::registry {

ModelRegistry::ModelRegistry() : schemas_(std::make_shared<const SchemaMap>()) {
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

void ModelRegistry::Load(const std::vector<model::ModelDefinition>& definitions) {
  auto next = std::make_shared<SchemaMap>();

  for (const auto& definition : definitions) {
    auto schema = model::ModelSchema::Build(definition);
    if (!next->emplace(schema->Name(), schema).second) {
      throw util::SchemaError("model '" + schema->Name() + "' is defined more than once");
    }
  }

  {
    std::unique_lock lock(mutex_);
    schemas_ = std::move(next);
  }

  MAPPER_LOG_INFO("Model registry loaded", {observability::IntField("models", static_cast<std::int64_t>(definitions.size()))});
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::shared_ptr<const ModelRegistry::SchemaMap> ModelRegistry::Snapshot() const {
  std::shared_lock lock(mutex_);
  return schemas_;
}

model::ModelSchemaPtr ModelRegistry::Resolve(const std::string& model_name) const {
  const auto snapshot = Snapshot();
  const auto it       = snapshot->find(model_name);
  if (it == snapshot->end()) {
    throw util::UnknownModelError("unknown model '" + model_name + "'");
  }
  return it->second;
}

bool ModelRegistry::Contains(const std::string& model_name) const {
  return Snapshot()->count(model_name) > 0;
}

std::vector<std::string> ModelRegistry::ModelNames() const {
  const auto               snapshot = Snapshot();
  std::vector<std::string> names;
  names.reserve(snapshot->size());
  for (const auto& [name, _] : *snapshot) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::size_t ModelRegistry::Size() const {
  return Snapshot()->size();
}

} // namespace mapper::registry
