#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"
#if MAPPER_STORAGE_SQLITE
#include "sqlite/sqlite_db.hpp"
#endif

namespace mapper::storage {

/*
  Builds the configured storage backend.

      auto backend = StorageFactory::Build(config.storage());
      engine = DataEngine(registry, backend, ...);

  An empty storage section selects the memory backend.
*/

class StorageFactory {
 public:
  static StorageBackendPtr Build(const mapper::runtime::config::StorageConfig& cfg);

#if MAPPER_STORAGE_SQLITE
  // Unset fields keep the SqliteOptions defaults (WAL on).
  static sqlite::SqliteOptions SqliteOptionsFor(const mapper::runtime::config::SqliteStorageConfig& cfg);
#endif
};

} // namespace mapper::storage
