#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/storage/storage_backend.hpp"
#include "sqlite_db.hpp"

namespace mapper::storage::sqlite {

/*
  Durable backend on a single SQLite file.

  Layout:
    mapper_records(namespace, model, id, body)  -- body = StoredRecord proto
    mapper_sequences(namespace, model, next_id)

  Writes run in BEGIN IMMEDIATE transactions; a backend mutex keeps the
  multi-statement writes of this process from interleaving on the shared
  connection.

  Must be owned by a shared_ptr (scans keep the backend alive).
*/
class SqliteBackend final : public StorageBackend, public std::enable_shared_from_this<SqliteBackend> {
 public:
  explicit SqliteBackend(std::shared_ptr<SqliteDB> db);

  model::Identifier Insert(const Scope& scope, const model::ValueMap& values, std::optional<model::Identifier> requested) override;
  std::optional<model::ValueMap> Fetch(const Scope& scope, model::Identifier id) override;
  model::ValueMap Update(const Scope& scope, model::Identifier id, const model::ValueMap& partial) override;
  bool Delete(const Scope& scope, model::Identifier id) override;
  Sequence<StoredRow> Scan(const Scope& scope, Predicate predicate) override;
  std::vector<std::string> Namespaces() override;

  std::string Name() const override {
    return "sqlite";
  }

 private:
  // Creates tables if missing.
  void Bootstrap();

  std::optional<model::ValueMap> FetchUnlocked(const Scope& scope, model::Identifier id);
  std::vector<model::Identifier> ListIds(const Scope& scope);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace mapper::storage::sqlite
