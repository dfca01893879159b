#include "storage_factory.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "memory/memory_backend.hpp"
#if MAPPER_STORAGE_SQLITE
#include "sqlite/sqlite_backend.hpp"
#include "sqlite/sqlite_db.hpp"
#endif

namespace mapper::storage {

using mapper::runtime::config::StorageConfig;

#if MAPPER_STORAGE_SQLITE
sqlite::SqliteOptions StorageFactory::SqliteOptionsFor(const mapper::runtime::config::SqliteStorageConfig& cfg) {
  sqlite::SqliteOptions options;
  if (cfg.has_wal_mode()) {
    options.wal_mode = cfg.wal_mode();
  }
  if (cfg.busy_timeout_ms() > 0) {
    options.busy_timeout_ms = cfg.busy_timeout_ms();
  }
  return options;
}
#endif

StorageBackendPtr StorageFactory::Build(const StorageConfig& cfg) {
  switch (cfg.backend_case()) {
    case StorageConfig::kSqlite: {
#if MAPPER_STORAGE_SQLITE
      const auto options = SqliteOptionsFor(cfg.sqlite());
      const auto path    = cfg.sqlite().path().empty() ? std::string("mapper.db") : cfg.sqlite().path();
      MAPPER_LOG_INFO("Selected storage backend", {observability::StringField("backend", "sqlite"), observability::StringField("path", path),
                                                observability::BoolField("wal_mode", options.wal_mode)});
      return std::make_shared<sqlite::SqliteBackend>(std::make_shared<sqlite::SqliteDB>(path, options));
#else
      throw std::runtime_error("sqlite storage requested but model-mapper was built without MAPPER_STORAGE_SQLITE");
#endif
    }
    case StorageConfig::kMemory:
    case StorageConfig::BACKEND_NOT_SET:
    default:
      MAPPER_LOG_INFO("Selected storage backend", {observability::StringField("backend", "memory")});
      return std::make_shared<memory::MemoryBackend>();
  }
}

} // namespace mapper::storage
