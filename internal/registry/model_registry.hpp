#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/schema.hpp"

namespace mapper::registry {

/*
  Model registry.

  Maps model name -> schema. The mapping is immutable once published;
  Load() builds a complete replacement and swaps the pointer, so readers
  holding a snapshot never see a partially loaded set.
*/
class ModelRegistry {
 public:
  using SchemaMap = std::unordered_map<std::string, model::ModelSchemaPtr>;

  ModelRegistry();

  // All-or-nothing: throws SchemaError and keeps the prior mapping when any
  // definition is invalid or two definitions share a name.
  void Load(const std::vector<model::ModelDefinition>& definitions);

  // Throws UnknownModelError.
  model::ModelSchemaPtr Resolve(const std::string& model_name) const;

  bool Contains(const std::string& model_name) const;

  // Sorted.
  std::vector<std::string> ModelNames() const;

  std::size_t Size() const;

  std::shared_ptr<const SchemaMap> Snapshot() const;

 private:
  mutable std::shared_mutex        mutex_;
  std::shared_ptr<const SchemaMap> schemas_;
};

} // namespace mapper::registry
