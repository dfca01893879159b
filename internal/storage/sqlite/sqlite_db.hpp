#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace mapper::storage::sqlite {

struct SqliteOptions {
  bool          wal_mode        = true;
  std::uint32_t busy_timeout_ms = 5000;
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/bootstrap/transactions)
  void Exec(const std::string& sql);

  // Prepare a statement; throws StorageError on failure
  Statement Prepare(const std::string& sql);

 private:
  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace mapper::storage::sqlite
