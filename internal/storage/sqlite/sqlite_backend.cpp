#include "sqlite_backend.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace mapper::storage::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindId(sqlite3_stmt* st, int idx, model::Identifier id) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(id.value));
}

void BindScope(sqlite3_stmt* st, const Scope& scope) {
  BindText(st, 1, scope.database);
  BindText(st, 2, scope.model);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

std::string Describe(const Scope& scope, model::Identifier id) {
  return "model '" + scope.model + "' in '" + scope.database + "' record " + std::to_string(id.value);
}

// Runs a statement expected to finish with SQLITE_DONE.
void StepDone(sqlite3* db, sqlite3_stmt* st, const std::string& context) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    return;
  }
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    throw util::DuplicateKeyError(context + ": " + sqlite3_errmsg(db));
  }
  throw util::StorageError(context + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteBackend::SqliteBackend(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Bootstrap();
  MAPPER_LOG_INFO("SQLite backend ready", {observability::StringField("path", db_->Path())});
}

void SqliteBackend::Bootstrap() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS mapper_records ("
      "namespace TEXT NOT NULL, model TEXT NOT NULL, id INTEGER NOT NULL, body BLOB NOT NULL, "
      "PRIMARY KEY (namespace, model, id));");
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS mapper_sequences ("
      "namespace TEXT NOT NULL, model TEXT NOT NULL, next_id INTEGER NOT NULL, "
      "PRIMARY KEY (namespace, model));");
}

// ------------------------------------------------------------------
// Insert
// ------------------------------------------------------------------

model::Identifier SqliteBackend::Insert(const Scope& scope, const model::ValueMap& values, std::optional<model::Identifier> requested) {
  std::scoped_lock  lock(mutex_);
  SqliteTransaction tx(db_);

  std::uint64_t next_id = 1;
  {
    auto st = db_->Prepare("SELECT next_id FROM mapper_sequences WHERE namespace=? AND model=?;");
    BindScope(st.get(), scope);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      next_id = ColU64(st.get(), 0);
    } else if (rc != SQLITE_DONE) {
      throw util::StorageError("read sequence for " + scope.ToString() + ": " + sqlite3_errmsg(db_->Handle()));
    }
  }

  model::Identifier id{next_id};
  if (requested) {
    id = *requested;
    CheckRequestedIdentifier(scope, id);
    if (FetchUnlocked(scope, id)) {
      throw util::DuplicateKeyError(Describe(scope, id) + " already exists");
    }
    next_id = std::max(next_id, id.value + 1);
  } else {
    CheckAssignedIdentifier(scope, next_id);
    ++next_id;
  }

  {
    auto st = db_->Prepare("INSERT INTO mapper_records(namespace,model,id,body) VALUES(?,?,?,?);");
    BindScope(st.get(), scope);
    BindId(st.get(), 3, id);
    BindBlob(st.get(), 4, EncodeRecord(values));
    StepDone(db_->Handle(), st.get(), Describe(scope, id));
  }

  {
    auto st = db_->Prepare(
        "INSERT INTO mapper_sequences(namespace,model,next_id) VALUES(?,?,?) "
        "ON CONFLICT(namespace,model) DO UPDATE SET next_id=excluded.next_id;");
    BindScope(st.get(), scope);
    sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(next_id));
    StepDone(db_->Handle(), st.get(), "advance sequence for " + scope.ToString());
  }

  tx.Commit();
  return id;
}

// ------------------------------------------------------------------
// Fetch
// ------------------------------------------------------------------

std::optional<model::ValueMap> SqliteBackend::FetchUnlocked(const Scope& scope, model::Identifier id) {
  auto st = db_->Prepare("SELECT body FROM mapper_records WHERE namespace=? AND model=? AND id=?;");
  BindScope(st.get(), scope);
  BindId(st.get(), 3, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw util::StorageError(Describe(scope, id) + ": " + sqlite3_errmsg(db_->Handle()));
  }
  return DecodeRecord(ColBlob(st.get(), 0));
}

std::optional<model::ValueMap> SqliteBackend::Fetch(const Scope& scope, model::Identifier id) {
  std::scoped_lock lock(mutex_);
  return FetchUnlocked(scope, id);
}

// ------------------------------------------------------------------
// Update
// ------------------------------------------------------------------

model::ValueMap SqliteBackend::Update(const Scope& scope, model::Identifier id, const model::ValueMap& partial) {
  std::scoped_lock  lock(mutex_);
  SqliteTransaction tx(db_);

  auto current = FetchUnlocked(scope, id);
  if (!current) {
    throw util::NotFoundError(Describe(scope, id) + " does not exist");
  }
  for (const auto& [field, value] : partial) {
    (*current)[field] = value;
  }

  auto st = db_->Prepare("UPDATE mapper_records SET body=? WHERE namespace=? AND model=? AND id=?;");
  BindBlob(st.get(), 1, EncodeRecord(*current));
  BindText(st.get(), 2, scope.database);
  BindText(st.get(), 3, scope.model);
  BindId(st.get(), 4, id);
  StepDone(db_->Handle(), st.get(), Describe(scope, id));

  tx.Commit();
  return *current;
}

// ------------------------------------------------------------------
// Delete
// ------------------------------------------------------------------

bool SqliteBackend::Delete(const Scope& scope, model::Identifier id) {
  std::scoped_lock lock(mutex_);

  auto st = db_->Prepare("DELETE FROM mapper_records WHERE namespace=? AND model=? AND id=?;");
  BindScope(st.get(), scope);
  BindId(st.get(), 3, id);
  StepDone(db_->Handle(), st.get(), Describe(scope, id));
  return sqlite3_changes(db_->Handle()) > 0;
}

// ------------------------------------------------------------------
// Scan
// ------------------------------------------------------------------

std::vector<model::Identifier> SqliteBackend::ListIds(const Scope& scope) {
  std::scoped_lock lock(mutex_);

  auto st = db_->Prepare("SELECT id FROM mapper_records WHERE namespace=? AND model=? ORDER BY id;");
  BindScope(st.get(), scope);

  std::vector<model::Identifier> ids;
  int                            rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    ids.push_back(model::Identifier{ColU64(st.get(), 0)});
  }
  if (rc != SQLITE_DONE) {
    throw util::StorageError("scan " + scope.ToString() + ": " + sqlite3_errmsg(db_->Handle()));
  }
  return ids;
}

Sequence<StoredRow> SqliteBackend::Scan(const Scope& scope, Predicate predicate) {
  auto self = shared_from_this();
  return Sequence<StoredRow>([self, scope, predicate]() -> CursorPtr<StoredRow> {
    return std::make_unique<FetchingCursor>(self, scope, self->ListIds(scope), predicate);
  });
}

std::vector<std::string> SqliteBackend::Namespaces() {
  std::scoped_lock lock(mutex_);

  auto                     st = db_->Prepare("SELECT DISTINCT namespace FROM mapper_sequences ORDER BY namespace;");
  std::vector<std::string> names;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    names.push_back(ColText(st.get(), 0));
  }
  return names;
}

} // namespace mapper::storage::sqlite
