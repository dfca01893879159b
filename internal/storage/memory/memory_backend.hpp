#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/storage/storage_backend.hpp"

namespace mapper::storage::memory {

/*
  Reference in-memory backend.

  (namespace, model) -> table of identifier -> value map, plus a
  monotonically increasing identifier counter per table. No I/O.

  Thread safety: one mutex serializes every call. Scans take the lock per
  row, never across the whole pass.

  Must be owned by a shared_ptr (scans keep the backend alive).
*/
class MemoryBackend final : public StorageBackend, public std::enable_shared_from_this<MemoryBackend> {
 public:
  MemoryBackend();

  model::Identifier Insert(const Scope& scope, const model::ValueMap& values, std::optional<model::Identifier> requested) override;
  std::optional<model::ValueMap> Fetch(const Scope& scope, model::Identifier id) override;
  model::ValueMap Update(const Scope& scope, model::Identifier id, const model::ValueMap& partial) override;
  bool Delete(const Scope& scope, model::Identifier id) override;
  Sequence<StoredRow> Scan(const Scope& scope, Predicate predicate) override;
  std::vector<std::string> Namespaces() override;

  std::string Name() const override {
    return "memory";
  }

 private:
  struct Table {
    std::string                                database;
    std::map<model::Identifier, model::ValueMap> rows;
    std::uint64_t                              next_id = 1;
  };

  std::vector<model::Identifier> ListIds(const Scope& scope);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Table> tables_;
};

} // namespace mapper::storage::memory
