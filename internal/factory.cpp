#include "factory.hpp"

#include <filesystem>
#include <string>

#include "internal/discovery/model_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"

namespace mapper::factory {

RuntimeDependencies BuildRuntime(const mapper::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.backend  = storage::StorageFactory::Build(config.storage());
  deps.registry = std::make_shared<registry::ModelRegistry>();

  const auto& directory = config.models().directory();
  if (!directory.empty()) {
    if (std::filesystem::is_directory(directory)) {
      deps.registry->Load(discovery::ModelLoader::LoadDirectory(directory));
    } else {
      MAPPER_LOG_WARN("Model directory not found", {observability::StringField("directory", directory)});
    }
  }

  const std::string ns = config.default_namespace().empty() ? std::string(engine::DataEngine::kDefaultNamespace) : config.default_namespace();
  deps.engine          = std::make_shared<engine::DataEngine>(deps.registry, deps.backend, ns);

  MAPPER_LOG_INFO("Runtime ready", {observability::StringField("backend", deps.backend->Name()), observability::StringField("namespace", ns),
                                    observability::IntField("models", static_cast<std::int64_t>(deps.registry->Size()))});
  return deps;
}

} // namespace mapper::factory
