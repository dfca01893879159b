#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/engine/data_engine.hpp"
#include "internal/registry/model_registry.hpp"
#include "internal/storage/storage_backend.hpp"

namespace mapper::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of one mapper instance.
*/
struct RuntimeDependencies {
  std::shared_ptr<registry::ModelRegistry> registry;
  storage::StorageBackendPtr               backend;
  std::shared_ptr<engine::DataEngine>      engine;
};

/*
  BuildRuntime

  Constructs backend, registry and engine from runtime config. Models are
  loaded from `models.directory` when that directory exists.

  NOTE:
  This is the composition root. It is the ONLY place (through
  StorageFactory) that knows concrete backend types.
*/
RuntimeDependencies BuildRuntime(const mapper::runtime::config::RuntimeConfig& config);

} // namespace mapper::factory
