#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace mapper::storage::sqlite {

/*
  Scoped write transaction.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Rolls back on destruction unless committed.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      done_ = false;
};

} // namespace mapper::storage::sqlite
